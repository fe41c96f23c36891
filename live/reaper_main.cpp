/**
 * @file reaper_main.cpp
 * @brief chatlive_reaper: removes expired transport handles and publishes
 *        timeout events
 */

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "common/database/redis_mgr.hpp"
#include "common/utils/cli_parser.hpp"
#include "common/utils/config_mgr.hpp"
#include "common/utils/log_manager.hpp"
#include "common/utils/signal_handler.hpp"
#include "live/delivery/chat_publisher.hpp"
#include "live/directory/user_directory.hpp"
#include "live/live_config.hpp"
#include "live/reaper/reaper.hpp"

using namespace chatlive::utils;
using namespace chatlive::live;

struct ReaperOptions {
    std::string config_file = "config/chatlive.json";
    std::string log_level;  // empty: live.log_level
    int interval_seconds = 0;  // 0: live.reaper_interval_ms
    bool once = false;
};

static ReaperOptions g_options;

static void setupCLIParser(CLIParser& parser) {
    parser.addArgument("config", 'c', ArgumentType::STRING, "Configuration file",
                       "config/chatlive.json", [](const std::string& value) -> bool {
                           g_options.config_file = value;
                           return true;
                       });

    parser.addArgument("log-level", 'l', ArgumentType::STRING,
                       "Log level (trace|debug|info|warn|error)", "",
                       [](const std::string& value) -> bool {
                           if (value == "trace" || value == "debug" || value == "info" ||
                               value == "warn" || value == "error") {
                               g_options.log_level = value;
                               return true;
                           }
                           std::cerr << "Invalid log level: " << value << std::endl;
                           return false;
                       });

    parser.addArgument("interval", 'i', ArgumentType::INTEGER, "Seconds between sweeps", "",
                       [](const std::string& value) -> bool {
                           try {
                               g_options.interval_seconds = std::stoi(value);
                           } catch (const std::out_of_range&) {
                               return false;
                           }
                           return g_options.interval_seconds > 0;
                       });

    parser.addArgument("once", 0, ArgumentType::FLAG, "Run a single sweep and exit", "",
                       [](const std::string&) -> bool {
                           g_options.once = true;
                           return true;
                       });
}

// Profiles for timeout events come from "directory.users" in the config file
static size_t loadDirectory(InMemoryUserDirectory& directory) {
    ConfigManager cfg_mgr(g_options.config_file);
    const auto& raw = cfg_mgr.get_raw_json();
    if (!raw.contains("directory") || !raw["directory"].contains("users")) {
        return 0;
    }
    return directory.load(raw["directory"]["users"]);
}

int main(int argc, char* argv[]) {
    try {
        CLIParser parser("chatlive_reaper", "Expired handle reaper for chatlive rooms");
        setupCLIParser(parser);

        auto parse_result = parser.parse(argc, argv);
        if (parse_result.help_requested) {
            parser.printHelp();
            return 0;
        }
        if (!parse_result.success) {
            std::cerr << "Error: " << parse_result.error_message << std::endl;
            return 1;
        }

        auto live_config = LiveConfig::from_file(g_options.config_file);
        LogManager::SetLogLevel(g_options.log_level.empty() ? live_config.log_level
                                                            : g_options.log_level);
        auto logger = LogManager::GetLogger("main");

        chatlive::db::RedisManager redis;
        if (!redis.initialize(g_options.config_file)) {
            logger->error("Failed to initialize Redis from {}", g_options.config_file);
            return 1;
        }

        InMemoryUserDirectory directory;
        auto profiles = loadDirectory(directory);
        if (profiles == 0) {
            logger->warn("No user profiles in {}, timeout events will not be published",
                         g_options.config_file);
        } else {
            logger->info("Loaded {} user profiles", profiles);
        }

        ChatPublisher publisher(redis, directory);
        auto interval = live_config.reaper_interval(g_options.interval_seconds);
        Reaper reaper(redis, publisher, directory, interval, live_config.presence_options());

        if (g_options.once) {
            auto removed = reaper.run_once();
            logger->info("Single sweep removed {} handles", removed);
            return 0;
        }

        auto& signal_handler = SignalHandler::getInstance();
        if (!signal_handler.registerGracefulShutdown(
                    [&logger](int, const std::string& signal_name) {
                        logger->info("Received {}, stopping reaper", signal_name);
                    })) {
            logger->warn("Failed to register some signal handlers");
        }

        reaper.start();
        signal_handler.waitForShutdown();
        reaper.stop();
        redis.shutdown();

        logger->info("chatlive_reaper shutdown complete");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
