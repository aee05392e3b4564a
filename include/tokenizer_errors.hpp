#pragma once
#include <stdexcept>
#include <string>

// Thrown while building a tokenizer when one of the required special tokens
// ([PAD], [MASK], [UNK], [EOS], [NOAGENT]) is absent from the vocabulary.
class MissingSpecialTokenError : public std::runtime_error {
public:
    explicit MissingSpecialTokenError(const std::string& token)
        : std::runtime_error(token + " token is missing in vocabulary!"), token_(token) {}

    const std::string& token() const { return token_; }

private:
    std::string token_;
};

// Thrown when a persisted vocabulary cannot be turned into a token-to-id mapping.
class VocabularyLoadError : public std::runtime_error {
public:
    VocabularyLoadError(const std::string& message, const std::string& path = "")
        : std::runtime_error(path.empty() ? message : message + ": " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Error loading config from JSON: " + message) {}
};
