#include "../include/reaction_tokenizer.hpp"
#include "../include/vocabulary_loader.hpp"
#include "../include/logger.hpp"
#include <cctype>

ReactionTokenizer::ReactionTokenizer(const VocabularyEntries& entries)
    : vocabulary_(entries), greedy_(vocabulary_) {
    log_construction();
}

ReactionTokenizer::ReactionTokenizer(const std::unordered_map<std::string, int>& token_to_id)
    : vocabulary_(token_to_id), greedy_(vocabulary_) {
    log_construction();
}

// The greedy tokenizer must point at this instance's own table
ReactionTokenizer::ReactionTokenizer(const ReactionTokenizer& other)
    : vocabulary_(other.vocabulary_),
      segmenter_(other.segmenter_),
      greedy_(vocabulary_),
      log_unknown_tokens_(other.log_unknown_tokens_) {}

ReactionTokenizer ReactionTokenizer::from_file(const std::string& vocab_path) {
    return ReactionTokenizer(load_vocabulary_file(vocab_path));
}

void ReactionTokenizer::log_construction() const {
    Logger& logger = Logger::getInstance();
    logger.log("Reaction tokenizer ready with " + std::to_string(vocabulary_.size()) + " tokens");
    logger.log("Special token ids: [PAD]=" + std::to_string(vocabulary_.pad_id()) +
               " [MASK]=" + std::to_string(vocabulary_.mask_id()) +
               " [UNK]=" + std::to_string(vocabulary_.unk_id()) +
               " [EOS]=" + std::to_string(vocabulary_.eos_id()) +
               " [NOAGENT]=" + std::to_string(vocabulary_.noagent_id()), LogLevel::DEBUG);
}

namespace {

// C-locale whitespace plus the ASCII file/group/record/unit separators
bool is_piece_separator(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isspace(uc) || (uc >= 0x1c && uc <= 0x1f);
}

}  // namespace

std::vector<std::string> ReactionTokenizer::split_into_pieces(const std::string& text) const {
    std::vector<std::string> pieces;
    std::string piece;
    for (char c : text) {
        if (is_piece_separator(c)) {
            if (!piece.empty()) {
                pieces.push_back(piece);
                piece.clear();
            }
        } else {
            piece += c;
        }
    }
    if (!piece.empty()) {
        pieces.push_back(piece);
    }
    return pieces;
}

std::vector<std::string> ReactionTokenizer::to_tokens(const std::string& text) const {
    std::vector<std::string> tokens;
    const bool trace = log_unknown_tokens_ && Logger::getInstance().is_enabled(LogLevel::DEBUG);

    for (const auto& piece : split_into_pieces(text)) {
        if (segmenter_.is_reaction_class(piece)) {
            tokens.push_back(piece);
        } else if (vocabulary_.contains(piece)) {
            // Special tokens and any other whole-piece vocabulary entry
            tokens.push_back(piece);
        } else {
            for (const auto& token : segmenter_.tokens(piece)) {
                tokens.push_back(token);
            }
            if (trace) {
                std::string dropped = segmenter_.dropped_characters(piece);
                if (!dropped.empty()) {
                    Logger::getInstance().log("Dropped characters '" + dropped + "' from '" + piece + "'",
                                              LogLevel::DEBUG);
                }
            }
        }
    }
    return tokens;
}

std::vector<int> ReactionTokenizer::encode(const std::string& text) const {
    std::vector<int> ids;
    const bool trace = log_unknown_tokens_ && Logger::getInstance().is_enabled(LogLevel::DEBUG);

    for (const auto& token : to_tokens(text)) {
        if (trace && !vocabulary_.contains(token)) {
            Logger::getInstance().log("Unknown token: '" + token + "'", LogLevel::DEBUG);
        }
        ids.push_back(vocabulary_.lookup_id(token));
    }
    return ids;
}

std::string ReactionTokenizer::decode(const std::vector<int>& tokens) const {
    if (tokens.empty()) {
        return "";
    }

    std::vector<std::string> words;
    words.reserve(tokens.size());
    for (int id : tokens) {
        if (id == vocabulary_.pad_id()) {
            continue;
        }
        words.push_back(vocabulary_.lookup_token(id));
    }

    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        const std::string& token = words[i];
        if (i > 0) {
            const std::string& previous = words[i - 1];
            // Reaction classes and bracketed tokens stand apart; SMILES atoms abut
            if (is_reaction_class(token) || is_reaction_class(previous) ||
                (!token.empty() && token[0] == '[') ||
                (!previous.empty() && previous[0] == '[')) {
                result += ' ';
            }
        }
        result += token;
    }
    return result;
}

int ReactionTokenizer::get_special_token_id(const std::string& token) const {
    return vocabulary_.lookup_id(token);
}

bool ReactionTokenizer::is_reaction_class(const std::string& text) const {
    return segmenter_.is_reaction_class(text);
}

std::vector<std::string> ReactionTokenizer::tokenize_smiles(const std::string& smiles) const {
    return segmenter_.segment(smiles);
}

std::vector<std::string> ReactionTokenizer::greedy_tokenize(const std::string& text) const {
    return greedy_.tokenize(text);
}
