#include "../include/vocabulary_loader.hpp"
#include "../include/tokenizer_errors.hpp"
#include "../include/logger.hpp"
#include <fstream>
#include <limits>

using json = nlohmann::ordered_json;

VocabularyEntries load_vocabulary_entries(const json& document, const std::string& source) {
    if (!document.is_object()) {
        throw VocabularyLoadError("Vocabulary is not a JSON object", source);
    }

    // Handle both formats: a flat token_to_id object or one nested under "token_to_id"
    const json* mapping = &document;
    auto nested = document.find("token_to_id");
    if (nested != document.end()) {
        if (!nested->is_object()) {
            throw VocabularyLoadError("\"token_to_id\" is not a JSON object", source);
        }
        mapping = &(*nested);
    }

    VocabularyEntries entries;
    entries.reserve(mapping->size());
    for (auto it = mapping->begin(); it != mapping->end(); ++it) {
        const json& value = it.value();
        if (!value.is_number_integer()) {
            throw VocabularyLoadError("Token '" + it.key() + "' does not map to an integer id", source);
        }
        bool in_range = value.is_number_unsigned()
            ? value.get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<int>::max())
            : value.get<long long>() >= std::numeric_limits<int>::min() &&
              value.get<long long>() <= std::numeric_limits<int>::max();
        if (!in_range) {
            throw VocabularyLoadError("Token '" + it.key() + "' has an id out of range", source);
        }
        entries.emplace_back(it.key(), value.get<int>());
    }
    return entries;
}

VocabularyEntries load_vocabulary_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw VocabularyLoadError("Could not open vocabulary file", path);
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw VocabularyLoadError("Invalid JSON (" + std::string(e.what()) + ")", path);
    }

    auto entries = load_vocabulary_entries(document, path);
    Logger::getInstance().log("Loaded " + std::to_string(entries.size()) +
                              " vocabulary entries from " + path, LogLevel::DEBUG);
    return entries;
}

void save_vocabulary_file(const VocabularyEntries& entries, const std::string& path) {
    json mapping = json::object();
    for (const auto& [token, id] : entries) {
        mapping[token] = id;
    }
    json document;
    document["token_to_id"] = mapping;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw VocabularyLoadError("Could not open vocabulary file for writing", path);
    }
    file << document.dump(2);
    if (!file.good()) {
        throw VocabularyLoadError("Failed to write vocabulary file", path);
    }
}
