#include "../include/vocabulary_table.hpp"
#include "../include/tokenizer_errors.hpp"
#include "../include/logger.hpp"

VocabularyTable::VocabularyTable(const VocabularyEntries& entries) {
    build(entries);
}

VocabularyTable::VocabularyTable(const std::unordered_map<std::string, int>& token_to_id) {
    build(VocabularyEntries(token_to_id.begin(), token_to_id.end()));
}

void VocabularyTable::build(const VocabularyEntries& entries) {
    // A repeated token keeps its first position but takes the later id
    for (const auto& [token, id] : entries) {
        auto inserted = token_to_id_.insert_or_assign(token, id);
        if (inserted.second) {
            insertion_order_.push_back(token);
        }
    }

    // Inverse mapping: the last token written for an id wins
    for (const auto& token : insertion_order_) {
        id_to_token_[token_to_id_.at(token)] = token;
    }

    pad_id_ = require(PAD_TOKEN);
    mask_id_ = require(MASK_TOKEN);
    unk_id_ = require(UNK_TOKEN);
    eos_id_ = require(EOS_TOKEN);
    noagent_id_ = require(NOAGENT_TOKEN);
}

int VocabularyTable::lookup_id(const std::string& token) const {
    auto it = token_to_id_.find(token);
    if (it != token_to_id_.end()) {
        return it->second;
    }
    return unk_id_;
}

std::string VocabularyTable::lookup_token(int id) const {
    auto it = id_to_token_.find(id);
    if (it != id_to_token_.end()) {
        return it->second;
    }
    return UNK_TOKEN;
}

bool VocabularyTable::contains(const std::string& token) const {
    return token_to_id_.find(token) != token_to_id_.end();
}

int VocabularyTable::require(const std::string& token) const {
    auto it = token_to_id_.find(token);
    if (it == token_to_id_.end()) {
        Logger::getInstance().log(token + " token is missing in vocabulary!", LogLevel::ERROR);
        throw MissingSpecialTokenError(token);
    }
    return it->second;
}
