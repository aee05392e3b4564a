#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include "base_tokenizer.hpp"
#include "vocabulary_table.hpp"
#include "smiles_segmenter.hpp"
#include "greedy_tokenizer.hpp"

/**
 * @brief Tokenizer for reaction SMILES optionally followed by a reaction class.
 *
 * Input such as "CCO>>CCCBr 2.12.13" is split on whitespace. Each piece is
 * emitted whole if it is a reaction class or a vocabulary entry, and is
 * otherwise segmented into SMILES atoms and symbols. Tokens missing from the
 * vocabulary become [UNK]. Decoding drops [PAD] and glues SMILES tokens back
 * together, separating reaction classes and bracketed tokens with a space.
 *
 * Only construction can fail. The instance is immutable afterwards and
 * encode/decode may be called concurrently.
 */
class ReactionTokenizer : public BaseTokenizer {
public:
    explicit ReactionTokenizer(const VocabularyEntries& entries);
    explicit ReactionTokenizer(const std::unordered_map<std::string, int>& token_to_id);

    // Loads a JSON vocabulary, flat or nested under "token_to_id"
    static ReactionTokenizer from_file(const std::string& vocab_path);

    ReactionTokenizer(const ReactionTokenizer& other);
    ReactionTokenizer& operator=(const ReactionTokenizer&) = delete;

    std::vector<int> encode(const std::string& text) const override;
    std::string decode(const std::vector<int>& tokens) const override;
    size_t vocab_size() const override { return vocabulary_.size(); }

    // Id of any token, [UNK] id if it is not in the vocabulary
    int get_special_token_id(const std::string& token) const;
    bool is_reaction_class(const std::string& text) const;

    std::vector<std::string> tokenize_smiles(const std::string& smiles) const;
    std::vector<std::string> greedy_tokenize(const std::string& text) const;

    int get_pad_token_id() const override { return vocabulary_.pad_id(); }
    int get_unk_token_id() const override { return vocabulary_.unk_id(); }
    int get_eos_token_id() const override { return vocabulary_.eos_id(); }
    int get_mask_token_id() const override { return vocabulary_.mask_id(); }
    int get_noagent_token_id() const override { return vocabulary_.noagent_id(); }

    const VocabularyTable& vocabulary() const { return vocabulary_; }

    void set_log_unknown_tokens(bool enabled) { log_unknown_tokens_ = enabled; }
    bool log_unknown_tokens() const { return log_unknown_tokens_; }

private:
    std::vector<std::string> split_into_pieces(const std::string& text) const;
    std::vector<std::string> to_tokens(const std::string& text) const;
    void log_construction() const;

    VocabularyTable vocabulary_;
    SmilesSegmenter segmenter_;
    GreedyTokenizer greedy_;
    bool log_unknown_tokens_ = false;
};
