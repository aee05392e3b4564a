#include <catch2/catch.hpp>
#include "../include/logger.hpp"
#include "../include/reaction_tokenizer.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

TEST_CASE("Log level names") {
    REQUIRE(parse_log_level("debug") == LogLevel::DEBUG);
    REQUIRE(parse_log_level("INFO") == LogLevel::INFO);
    REQUIRE(parse_log_level("Warning") == LogLevel::WARNING);
    REQUIRE(parse_log_level("error") == LogLevel::ERROR);
    REQUIRE(parse_log_level("verbose") == LogLevel::INFO);
    REQUIRE(std::string(log_level_name(LogLevel::WARNING)) == "WARNING");
}

TEST_CASE("Logger filters by level and writes to its file") {
    Logger& logger = Logger::getInstance();
    fs::path path = fs::temp_directory_path() / "rxn_tokenizer_logger_test.log";
    fs::remove(path);

    REQUIRE(logger.setLogFile(path.string()));
    REQUIRE(logger.getLogFile() == path.string());
    logger.setLogLevel(LogLevel::WARNING);
    logger.log("hidden info message");
    logger.log("visible warning message", LogLevel::WARNING);
    logger.log("visible error message", LogLevel::ERROR);

    logger.setLogLevel(LogLevel::INFO);
    REQUIRE(logger.setLogFile(""));

    std::string contents = read_file(path);
    REQUIRE(contents.find("=== Log started at:") != std::string::npos);
    REQUIRE(contents.find("hidden info message") == std::string::npos);
    REQUIRE(contents.find("[WARNING] visible warning message") != std::string::npos);
    REQUIRE(contents.find("[ERROR] visible error message") != std::string::npos);
    fs::remove(path);
}

TEST_CASE("Unknown tokens are traced at debug level") {
    Logger& logger = Logger::getInstance();
    fs::path path = fs::temp_directory_path() / "rxn_tokenizer_trace_test.log";
    fs::remove(path);
    REQUIRE(logger.setLogFile(path.string()));
    logger.setLogLevel(LogLevel::DEBUG);

    VocabularyEntries entries = {
        {"[PAD]", 0}, {"[MASK]", 1}, {"[UNK]", 2}, {"[EOS]", 3}, {"[NOAGENT]", 4}, {"C", 5}};
    ReactionTokenizer tokenizer(entries);
    tokenizer.set_log_unknown_tokens(true);
    std::vector<int> ids = tokenizer.encode("CN>C");

    logger.setLogLevel(LogLevel::INFO);
    REQUIRE(logger.setLogFile(""));

    REQUIRE(ids == std::vector<int>{5, 2, 5});
    std::string contents = read_file(path);
    REQUIRE(contents.find("[DEBUG] Unknown token: 'N'") != std::string::npos);
    REQUIRE(contents.find("Dropped characters '>' from 'CN>C'") != std::string::npos);
    fs::remove(path);
}
