#ifndef CHATLIVE_LIVE_CONFIG_HPP
#define CHATLIVE_LIVE_CONFIG_HPP

/******************************************************************************
 *
 * @file       live_config.hpp
 * @brief      "live.*" settings: liveness window, reaper cadence, log level
 *
 *****************************************************************************/

#include <chrono>
#include <string>

#include "live/presence/user_list_store.hpp"

namespace chatlive::live {

struct LiveConfig {
    int liveness_ttl_ms = 30000;
    int reaper_interval_ms = 10000;
    std::string log_level = "info";

    // CHATLIVE_LOG_LEVEL overrides live.log_level
    static LiveConfig from_file(const std::string& config_path);

    PresenceOptions presence_options() const {
        return {std::chrono::milliseconds(liveness_ttl_ms)};
    }
    std::chrono::milliseconds reaper_interval() const {
        return std::chrono::milliseconds(reaper_interval_ms);
    }
    // override_seconds > 0 (the --interval option) replaces live.reaper_interval_ms
    std::chrono::milliseconds reaper_interval(int override_seconds) const {
        if (override_seconds > 0) {
            return std::chrono::seconds(override_seconds);
        }
        return reaper_interval();
    }
};

}  // namespace chatlive::live

#endif  // CHATLIVE_LIVE_CONFIG_HPP
