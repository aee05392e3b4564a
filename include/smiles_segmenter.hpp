#pragma once
#include <string>
#include <vector>
#include <regex>
#include <iterator>
#include <cstddef>

/**
 * @brief Lazily scanned sequence of SMILES tokens over an owned copy of the input.
 *
 * Every call to begin() starts a fresh scan, so the range can be walked any
 * number of times. Iterators refer to the range's own buffer and are
 * invalidated when the range is moved or destroyed.
 */
class SmilesTokenRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = std::string;

        iterator() = default;
        explicit iterator(std::sregex_iterator it) : it_(std::move(it)) {}

        std::string operator*() const { return it_->str(); }
        // Offset of the current token in the scanned text
        size_t position() const { return static_cast<size_t>(it_->position()); }

        iterator& operator++() {
            ++it_;
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            ++it_;
            return tmp;
        }

        bool operator==(const iterator& other) const { return it_ == other.it_; }
        bool operator!=(const iterator& other) const { return it_ != other.it_; }

    private:
        std::sregex_iterator it_;
    };

    SmilesTokenRange(std::string text, const std::regex& pattern)
        : text_(std::move(text)), pattern_(&pattern) {}

    iterator begin() const {
        return iterator(std::sregex_iterator(text_.begin(), text_.end(), *pattern_));
    }
    iterator end() const { return iterator(); }

    const std::string& text() const { return text_; }

private:
    std::string text_;
    const std::regex* pattern_;
};

/**
 * @brief Pattern-based recognizers for reaction strings.
 *
 * Two independent recognizers share this class:
 * - reaction classes: one or more digit groups joined by single dots ("2.12.13")
 * - SMILES atoms and symbols, matched left to right with ordered alternatives:
 *   ">>", a bracket group of 1-10 non-bracket characters, a two-letter element
 *   symbol, then a single atom/bond/ring/branch character.
 *
 * Characters that match no alternative are skipped and never reported as
 * tokens. The compiled patterns are shared and read-only.
 */
class SmilesSegmenter {
public:
    static const char* const SMILES_REGEX;

    // Whole-string match; empty strings are never reaction classes
    bool is_reaction_class(const std::string& text) const;

    SmilesTokenRange tokens(std::string text) const;
    std::vector<std::string> segment(const std::string& text) const;

    // Characters the scan skipped, in input order
    std::string dropped_characters(const std::string& text) const;

private:
    static const std::regex& smiles_pattern();
};
