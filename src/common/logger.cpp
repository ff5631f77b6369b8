/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "common/logger.hpp"

#include <mutex>

namespace mvccdb {

namespace {
std::mutex &logger_mutex() {
    static std::mutex mutex;
    return mutex;
}
}  // namespace

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(logger_mutex());
    init_locked(name, level);
}

void Logger::init_locked(const std::string& name, spdlog::level::level_enum level) {
    if (logger_ == nullptr) {
        logger_ = spdlog::get(name);
        if (logger_ == nullptr) {
            logger_ = spdlog::stdout_color_mt(name);
        }
        logger_->set_level(level);
        logger_->set_pattern(config::kLogPattern);
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger_ == nullptr) {
        init_locked(config::kDefaultLoggerName, spdlog::level::info);
    }
    return logger_;
}

void Logger::set_level(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger_ != nullptr) {
        logger_->set_level(level);
    }
}

bool Logger::set_level(std::string_view level_name) {
    // from_str() maps unknown names to off
    auto level = spdlog::level::from_str(std::string(level_name));
    if (level == spdlog::level::off && level_name != "off") {
        return false;
    }
    get()->set_level(level);
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger_ != nullptr) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

}  // namespace mvccdb
