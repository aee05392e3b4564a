#include "../include/config.hpp"
#include "../include/logger.hpp"
#include "../include/tokenizer_errors.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

void TokenizerConfig::load_from_json(const std::string& config_path) {
    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + config_path);
        }

        nlohmann::json j;
        file >> j;
        from_json(j, *this);
    } catch (const std::exception& e) {
        throw ConfigError(e.what());
    }

    Logger::getInstance().log("Loaded tokenizer configuration from: " + config_path, LogLevel::DEBUG);
}

bool TokenizerConfig::operator==(const TokenizerConfig& other) const {
    return vocab_path == other.vocab_path &&
           log_unknown_tokens == other.log_unknown_tokens &&
           logging.enabled == other.logging.enabled &&
           logging.level == other.logging.level &&
           logging.file == other.logging.file;
}

void apply_logging(const TokenizerConfig& config) {
    Logger& logger = Logger::getInstance();
    logger.setLogLevel(parse_log_level(config.logging.level));
    logger.setLogFile(config.logging.file);
    if (config.logging.enabled) {
        logger.enableLogging();
    } else {
        logger.disableLogging();
    }
}

void to_json(nlohmann::json& j, const LoggingConfig& l) {
    j = nlohmann::json{
        {"enabled", l.enabled},
        {"level", l.level},
        {"file", l.file}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& l) {
    l.enabled = j.value("enabled", l.enabled);
    l.level = j.value("level", l.level);
    l.file = j.value("file", l.file);
}

void to_json(nlohmann::json& j, const TokenizerConfig& t) {
    j = nlohmann::json{
        {"tokenizer", {
            {"vocab_path", t.vocab_path},
            {"log_unknown_tokens", t.log_unknown_tokens}
        }},
        {"logging", t.logging}
    };
}

void from_json(const nlohmann::json& j, TokenizerConfig& t) {
    // Load tokenizer section
    if (j.contains("tokenizer")) {
        const auto& tok = j["tokenizer"];
        t.vocab_path = tok.value("vocab_path", t.vocab_path);
        t.log_unknown_tokens = tok.value("log_unknown_tokens", t.log_unknown_tokens);
    }

    // Load logging section
    if (j.contains("logging")) {
        from_json(j["logging"], t.logging);
    }
}
