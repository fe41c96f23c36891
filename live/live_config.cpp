#include "live_config.hpp"

#include "common/utils/config_mgr.hpp"
#include "common/utils/log_manager.hpp"

namespace chatlive::live {

using chatlive::utils::ConfigManager;
using chatlive::utils::LogManager;

LiveConfig LiveConfig::from_file(const std::string& config_path) {
    LiveConfig config;
    try {
        ConfigManager cfg_mgr(config_path);

        config.liveness_ttl_ms = cfg_mgr.get<int>("live.liveness_ttl_ms", config.liveness_ttl_ms);
        config.reaper_interval_ms =
                cfg_mgr.get<int>("live.reaper_interval_ms", config.reaper_interval_ms);
        config.log_level = cfg_mgr.getWithEnv<std::string>("live.log_level", "CHATLIVE_LOG_LEVEL",
                                                           config.log_level);
    } catch (const std::exception& e) {
        LogManager::GetLogger("main")->error("Failed to load live config: {}", e.what());
        throw;
    }

    if (config.liveness_ttl_ms <= 0 || config.reaper_interval_ms <= 0) {
        throw std::invalid_argument("live.* durations must be positive");
    }
    return config;
}

}  // namespace chatlive::live
