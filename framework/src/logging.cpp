
#include "logging.hpp"
#include <iostream> // std::cout, std::cerr, std::endl

namespace {
    LogLevel current_level = LogLevel::Warning;
}

void set_log_level(LogLevel level) {
    current_level = level;
}

LogLevel get_log_level() {
    return current_level;
}

void log_message(LogLevel level, const std::string& message) {
    if (level < current_level) {
        return;
    }
    
    switch (level) {
        case LogLevel::Trace:
            std::cout << "[TRACE] - " << message << std::endl;
            break;
        case LogLevel::Info:
            std::cout << "[INFO] - " << message << std::endl;
            break;
        case LogLevel::Warning:
            std::cout << "[WARNING] - " << message << std::endl;
            break;
        case LogLevel::Error:
            std::cerr << "[ERROR] - " << message << std::endl;
            break;
    }
}
