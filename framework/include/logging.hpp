#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string> // std::string

enum class LogLevel {
    Trace = 0,
    Info,
    Warning,
    Error
};

// Messages below the current level are dropped (default: Warning)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Errors go to std::cerr, everything else to std::cout
void log_message(LogLevel level, const std::string& message);

#endif // LOGGING_HPP
