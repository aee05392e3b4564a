#pragma once
#include <string>
#include <fstream>
#include <mutex>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

// Maps "debug", "info", "warning" or "error" (any case) to a level.
// Unknown names fall back to INFO.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

class Logger {
private:
    std::ofstream log_file;
    std::string log_path;
    bool logging_enabled;
    LogLevel current_level;
    mutable std::mutex log_mutex;

    Logger();  // Private constructor for singleton

public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& getInstance();
    void log(const std::string& message);
    void log(const std::string& message, LogLevel level);
    bool is_enabled(LogLevel level) const;
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    // Appends to the given file; an empty path routes output back to stderr.
    // Returns false if the file could not be opened.
    bool setLogFile(const std::string& path);
    const std::string& getLogFile() const { return log_path; }

    void enableLogging();
    void disableLogging();
    ~Logger();
};
