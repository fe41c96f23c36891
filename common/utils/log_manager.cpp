#include "log_manager.hpp"

namespace chatlive {
namespace utils {

namespace {
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
}

std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> LogManager::s_loggers_;
std::unordered_map<std::string, bool> LogManager::s_loggingEnabled_;
std::mutex LogManager::s_mutex_;

std::shared_ptr<spdlog::logger> LogManager::RegisterLocked(std::shared_ptr<spdlog::logger> logger) {
    logger->set_pattern(kPattern);
    s_loggers_[logger->name()] = logger;
    s_loggingEnabled_[logger->name()] = true;
    return logger;
}

void LogManager::SetLogToFile(const std::string& logger_name, const std::string& filename) {
    std::lock_guard<std::mutex> lock(s_mutex_);
    spdlog::drop(logger_name);  // basic_logger_mt refuses duplicate names
    RegisterLocked(spdlog::basic_logger_mt(logger_name, filename));
}

void LogManager::SetLogToConsole(const std::string& logger_name) {
    std::lock_guard<std::mutex> lock(s_mutex_);
    spdlog::drop(logger_name);
    RegisterLocked(spdlog::stdout_color_mt(logger_name));
}

void LogManager::SetLoggingEnabled(const std::string& logger_name, bool enabled) {
    std::lock_guard<std::mutex> lock(s_mutex_);
    s_loggingEnabled_[logger_name] = enabled;
    auto it = s_loggers_.find(logger_name);
    if (it != s_loggers_.end()) {
        it->second->set_level(enabled ? spdlog::level::info : spdlog::level::off);
    }
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& logger_name) {
    std::lock_guard<std::mutex> lock(s_mutex_);
    auto it = s_loggers_.find(logger_name);
    if (it != s_loggers_.end()) {
        return it->second;
    }
    // Another module may have registered the name directly with spdlog
    if (auto existing = spdlog::get(logger_name)) {
        return RegisterLocked(existing);
    }
    return RegisterLocked(spdlog::stdout_color_mt(logger_name));
}

bool LogManager::IsLoggingEnabled(const std::string& logger_name) {
    std::lock_guard<std::mutex> lock(s_mutex_);
    auto it = s_loggingEnabled_.find(logger_name);
    if (it != s_loggingEnabled_.end()) {
        return it->second;
    }
    return true;
}

void LogManager::SetLogLevel(spdlog::level::level_enum level, const std::string& logger_name) {
    if (logger_name.empty()) {
        std::lock_guard<std::mutex> lock(s_mutex_);
        for (auto& logger : s_loggers_) {
            logger.second->set_level(level);
        }
        spdlog::set_level(level);
        return;
    }
    GetLogger(logger_name)->set_level(level);
}

void LogManager::SetLogLevel(const std::string& level, const std::string& logger_name) {
    SetLogLevel(spdlog::level::from_str(level), logger_name);
}

void LogManager::SetLogLevel(const std::string& level,
                             const std::vector<std::string>& logger_names) {
    for (const auto& logger_name : logger_names) {
        SetLogLevel(level, logger_name);
    }
}

}  // namespace utils
}  // namespace chatlive
