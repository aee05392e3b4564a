#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <nlohmann/json.hpp>

struct LoggingConfig {
    bool enabled = true;
    std::string level = "info";
    std::string file;  // empty: log to stderr
};

/**
 * @brief Runtime settings for the reaction tokenizer.
 *
 * Loaded from a JSON document with two optional sections:
 * - "tokenizer": vocabulary location and diagnostics switches
 * - "logging": level, destination and on/off switch for the Logger
 * Keys that are absent keep their default values.
 */
struct TokenizerConfig {
    std::string vocab_path = "data/vocab.json";
    bool log_unknown_tokens = false;

    LoggingConfig logging;

    /**
     * @brief Loads configuration from a JSON file.
     * @throws ConfigError if the file cannot be opened or parsed
     */
    void load_from_json(const std::string& config_path);

    bool operator==(const TokenizerConfig& other) const;
    bool operator!=(const TokenizerConfig& other) const { return !(*this == other); }
};

// Pushes the logging section into the Logger singleton.
void apply_logging(const TokenizerConfig& config);

// JSON serialization declarations
void to_json(nlohmann::json& j, const LoggingConfig& l);
void from_json(const nlohmann::json& j, LoggingConfig& l);

void to_json(nlohmann::json& j, const TokenizerConfig& t);
void from_json(const nlohmann::json& j, TokenizerConfig& t);

#endif // CONFIG_HPP
