#pragma once
#include <string>
#include <vector>
#include "vocabulary_table.hpp"

/**
 * @brief Legacy longest-match-first segmentation against the vocabulary.
 *
 * At each position the longest substring present in the vocabulary is taken;
 * if none matches, "[UNK]" is emitted and the scan advances one character.
 * Every candidate length is tried, so the worst case is quadratic in the
 * input length. Returns token strings rather than ids.
 *
 * Kept for compatibility with older data; ReactionTokenizer::encode does not
 * use it.
 */
class GreedyTokenizer {
public:
    explicit GreedyTokenizer(const VocabularyTable& vocabulary) : vocabulary_(vocabulary) {}

    std::vector<std::string> tokenize(const std::string& text) const;

private:
    const VocabularyTable& vocabulary_;
};
