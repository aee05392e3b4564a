#include "../include/smiles_segmenter.hpp"

const char* const SmilesSegmenter::SMILES_REGEX =
    R"(>>|\[[^\[\]]{1,10}\]|Br|Cl|Si|Se|Na|Ca|Li|Mg|Zn|Cu|Fe|Mn|Hg|Ag|Au|[B-IK-Zb-ik-z0-9=#$%@+\-()/\\.])";

const std::regex& SmilesSegmenter::smiles_pattern() {
    static const std::regex pattern(SMILES_REGEX, std::regex::ECMAScript | std::regex::optimize);
    return pattern;
}

// Digit groups joined by single dots. Scanned by hand: std::regex recurses
// once per character and overflows the stack on long digit runs.
bool SmilesSegmenter::is_reaction_class(const std::string& text) const {
    bool in_group = false;
    for (char c : text) {
        if (c >= '0' && c <= '9') {
            in_group = true;
        } else if (c == '.' && in_group) {
            in_group = false;
        } else {
            return false;
        }
    }
    return in_group;
}

SmilesTokenRange SmilesSegmenter::tokens(std::string text) const {
    return SmilesTokenRange(std::move(text), smiles_pattern());
}

std::vector<std::string> SmilesSegmenter::segment(const std::string& text) const {
    std::vector<std::string> result;
    auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), smiles_pattern()); it != end; ++it) {
        result.push_back(it->str());
    }
    return result;
}

std::string SmilesSegmenter::dropped_characters(const std::string& text) const {
    std::string dropped;
    size_t last_end = 0;
    auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(text.begin(), text.end(), smiles_pattern()); it != end; ++it) {
        auto start = static_cast<size_t>(it->position());
        dropped.append(text, last_end, start - last_end);
        last_end = start + static_cast<size_t>(it->length());
    }
    dropped.append(text, last_end, std::string::npos);
    return dropped;
}
