#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace Trawl {
namespace Core {

int Logger::level_ = LogLevel::LOG_ALL;

std::mutex Logger::mutex_;

namespace {
constexpr const char* RESET   = "\033[0m";
constexpr const char* RED     = "\033[31m";
constexpr const char* GREEN   = "\033[32m";
constexpr const char* YELLOW  = "\033[33m";
constexpr const char* BLUE    = "\033[34m";
constexpr const char* MAGENTA = "\033[35m";
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

int Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "none" || lower == "off")
        return LOG_NONE;
    if (lower == "error")
        return LOG_ERROR;
    if (lower == "warn" || lower == "warning")
        return LOG_ERROR | LOG_WARN;
    if (lower == "info")
        return LOG_ALL;
    if (lower == "debug")
        return LOG_VERBOSE;

    throw std::invalid_argument("Unknown log level: " + name);
}

void Logger::write(int flag, const char* color, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & flag))
        return;
    std::ostream& out = (flag & (LOG_WARN | LOG_ERROR)) ? std::cerr : std::cout;
    out << color << "[" << tag << "] " << RESET << message << std::endl;
}

void Logger::debug(const std::string& message) {
    write(LOG_DEBUG, MAGENTA, "DEBUG", message);
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, BLUE, "INFO", message);
}

void Logger::success(const std::string& message) {
    write(LOG_SUCCESS, GREEN, "SUCCESS", message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, YELLOW, "WARN", message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, RED, "ERROR", message);
}

}  // namespace Core
}  // namespace Trawl
