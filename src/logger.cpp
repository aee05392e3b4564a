#include "../include/logger.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

Logger::Logger() : logging_enabled(true), current_level(LogLevel::INFO) {}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path.clear();
    if (path.empty()) {
        return true;
    }

    // Create the parent directory if it doesn't exist
    std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path.parent_path(), ec);
    }

    log_file.open(path, std::ios::out | std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        return false;
    }
    log_path = path;

    // Log the start time
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    log_file << "=== Log started at: " << std::put_time(std::localtime(&time_t_now), "%d-%m-%Y %H:%M:%S")
             << " ===" << std::endl;
    return true;
}

void Logger::log(const std::string& message) {
    log(message, LogLevel::INFO);
}

void Logger::log(const std::string& message, LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!logging_enabled || level < current_level) return;

    const char* level_str = log_level_name(level);
    if (log_file.is_open()) {
        log_file << "[" << level_str << "] " << message << std::endl;
    } else {
        std::cerr << "[" << level_str << "] " << message << std::endl;
    }
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(log_mutex);
    return logging_enabled && level >= current_level;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(log_mutex);
    return current_level;
}

void Logger::enableLogging() {
    std::lock_guard<std::mutex> lock(log_mutex);
    logging_enabled = true;
}

void Logger::disableLogging() {
    std::lock_guard<std::mutex> lock(log_mutex);
    logging_enabled = false;
}

Logger::~Logger() {
    if (log_file.is_open()) {
        log_file.close();
    }
}
