#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "vocabulary_table.hpp"

// Reads {"token": id, ...} or {"token_to_id": {"token": id, ...}, ...}.
// ordered_json keeps entries in document order.
VocabularyEntries load_vocabulary_entries(const nlohmann::ordered_json& document,
                                          const std::string& source = "");

// Parses a JSON vocabulary file; throws VocabularyLoadError on any failure
VocabularyEntries load_vocabulary_file(const std::string& path);

// Writes {"token_to_id": {...}} preserving entry order
void save_vocabulary_file(const VocabularyEntries& entries, const std::string& path);
