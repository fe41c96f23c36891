#ifndef CHATLIVE_LOG_MANAGER_HPP
#define CHATLIVE_LOG_MANAGER_HPP

/******************************************************************************
 *
 * @file       log_manager.hpp
 * @brief      Named spdlog loggers shared by every chatlive component
 *
 *****************************************************************************/

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "singleton.hpp"

namespace chatlive {
namespace utils {

class LogManager : public Singleton<LogManager> {
public:
    // Route a logger to a file, replacing any previous sink
    static void SetLogToFile(const std::string& logger_name, const std::string& filename);
    // Route a logger to the colored console
    static void SetLogToConsole(const std::string& logger_name);
    static void SetLoggingEnabled(const std::string& logger_name, bool enabled);
    // Returns the named logger, creating a console logger on first use
    static std::shared_ptr<spdlog::logger> GetLogger(const std::string& logger_name);
    static bool IsLoggingEnabled(const std::string& logger_name);

    // An empty name applies the level to every known logger
    static void SetLogLevel(spdlog::level::level_enum level, const std::string& logger_name = "");
    static void SetLogLevel(const std::string& level, const std::string& logger_name = "");
    static void SetLogLevel(const std::string& level, const std::vector<std::string>& logger_names);

private:
    static std::shared_ptr<spdlog::logger> RegisterLocked(std::shared_ptr<spdlog::logger> logger);

    static std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> s_loggers_;
    static std::unordered_map<std::string, bool> s_loggingEnabled_;
    static std::mutex s_mutex_;
};

}  // namespace utils
}  // namespace chatlive

#endif  // CHATLIVE_LOG_MANAGER_HPP
