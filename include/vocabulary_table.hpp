#pragma once
#include <string>
#include <vector>
#include <utility>
#include <unordered_map>

// Token/id pairs in source order. Order matters: when two tokens share an id,
// the inverse mapping keeps the one that comes last.
using VocabularyEntries = std::vector<std::pair<std::string, int>>;

/**
 * @brief Immutable bidirectional token <-> id mapping.
 *
 * Built once from an externally supplied mapping and never modified
 * afterwards, so a single instance can be read from any number of threads.
 * Construction fails with MissingSpecialTokenError if any of the five
 * special tokens is absent.
 */
class VocabularyTable {
public:
    static constexpr const char* PAD_TOKEN = "[PAD]";
    static constexpr const char* MASK_TOKEN = "[MASK]";
    static constexpr const char* UNK_TOKEN = "[UNK]";
    static constexpr const char* EOS_TOKEN = "[EOS]";
    static constexpr const char* NOAGENT_TOKEN = "[NOAGENT]";

    explicit VocabularyTable(const VocabularyEntries& entries);
    explicit VocabularyTable(const std::unordered_map<std::string, int>& token_to_id);

    // Id of the token, or the [UNK] id for anything not in the vocabulary
    int lookup_id(const std::string& token) const;

    // Token for the id, or "[UNK]" for ids not in the vocabulary
    std::string lookup_token(int id) const;

    bool contains(const std::string& token) const;

    // Id of the token; throws MissingSpecialTokenError if absent
    int require(const std::string& token) const;

    // Number of distinct token strings (ids may repeat)
    size_t size() const { return token_to_id_.size(); }

    int pad_id() const { return pad_id_; }
    int mask_id() const { return mask_id_; }
    int unk_id() const { return unk_id_; }
    int eos_id() const { return eos_id_; }
    int noagent_id() const { return noagent_id_; }

    // Tokens in first-insertion order
    const std::vector<std::string>& tokens() const { return insertion_order_; }

private:
    void build(const VocabularyEntries& entries);

    std::unordered_map<std::string, int> token_to_id_;
    std::unordered_map<int, std::string> id_to_token_;
    std::vector<std::string> insertion_order_;

    int pad_id_ = -1;
    int mask_id_ = -1;
    int unk_id_ = -1;
    int eos_id_ = -1;
    int noagent_id_ = -1;
};
