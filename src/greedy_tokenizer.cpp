#include "../include/greedy_tokenizer.hpp"

std::vector<std::string> GreedyTokenizer::tokenize(const std::string& text) const {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        size_t match_length = 0;
        for (size_t j = text.size(); j > i; --j) {
            if (vocabulary_.contains(text.substr(i, j - i))) {
                match_length = j - i;
                break;
            }
        }

        if (match_length > 0) {
            tokens.push_back(text.substr(i, match_length));
            i += match_length;
        } else {
            tokens.push_back(VocabularyTable::UNK_TOKEN);
            i += 1;
        }
    }
    return tokens;
}
