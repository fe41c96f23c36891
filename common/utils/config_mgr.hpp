#ifndef CHATLIVE_CONFIG_MGR_HPP
#define CHATLIVE_CONFIG_MGR_HPP

/******************************************************************************
 *
 * @file       config_mgr.hpp
 * @brief      JSON configuration with dotted keys and environment overrides
 *
 * @details    "redis.port" addresses {"redis": {"port": ...}}. A missing file
 *             leaves the configuration empty, so every get<T> falls back to
 *             its default.
 *
 *****************************************************************************/

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace chatlive {
namespace utils {

using json = nlohmann::json;

class ConfigManager {
public:
    /**
     * @brief Load a JSON configuration file
     * @param path file path
     * @throws nlohmann::json::parse_error if the file exists but is not valid JSON
     */
    explicit ConfigManager(const std::string& path) : path_(std::filesystem::absolute(path)) {
        std::ifstream file(path_);
        if (file.is_open()) {
            file >> json_;
            flatten_json(json_, "", config_);
        }
    }

    /**
     * @brief Load a JSON file, then overlay environment variables
     * @param path file path
     * @param env_vars environment variables to import, e.g. {"REDIS_HOST"}
     * @param env_prefix optional prefix, CHATLIVE -> reads CHATLIVE_REDIS_HOST
     */
    ConfigManager(const std::string& path, const std::vector<std::string>& env_vars,
                  const std::string& env_prefix = "")
            : ConfigManager(path) {
        loadEnvironmentVariables(env_vars, env_prefix);
    }

    /**
     * @brief Load KEY=VALUE lines from a .env file
     * @param env_file path of the .env file
     * @param override_existing replace keys that are already set
     * @return false if the file could not be opened
     */
    bool loadEnvFile(const std::string& env_file, bool override_existing = false) {
        std::ifstream file(env_file);
        if (!file.is_open()) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            boost::trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                continue;
            }
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            boost::trim(key);
            boost::trim(value);

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            if (override_existing || !has_key(key)) {
                setEnvironmentValue(key, value);
            }
        }
        return true;
    }

    // Raw string form of a scalar, "" when absent
    std::string get(const std::string& key) const {
        auto it = config_.find(key);
        if (it != config_.end()) {
            return it->second;
        }
        return "";
    }

    template <typename T>
    T get(const std::string& key, const T& default_value = T{}) const {
        try {
            auto pointer = to_pointer(key);
            if (json_.contains(pointer)) {
                return json_.at(pointer).get<T>();
            }
        } catch (const json::exception&) {
            // wrong type for this key, fall through to the default
        }
        return default_value;
    }

    template <typename T>
    void set(const std::string& key, const T& value) {
        json_[to_pointer(key)] = value;

        if constexpr (std::is_same_v<T, bool>) {
            config_[key] = value ? "true" : "false";
        } else if constexpr (std::is_arithmetic_v<T>) {
            config_[key] = std::to_string(value);
        } else if constexpr (std::is_convertible_v<T, std::string>) {
            config_[key] = std::string(value);
        } else {
            config_[key] = json(value).dump();
        }
    }

    bool has_key(const std::string& key) const {
        try {
            return json_.contains(to_pointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }

    const json& get_raw_json() const { return json_; }

    /**
     * @brief Read a value, preferring an environment variable
     * @param key dotted configuration key
     * @param env_key environment variable name
     * @param default_value used when neither source has the value
     * @return environment value, then the file value, then the default
     */
    template <typename T>
    T getWithEnv(const std::string& key, const std::string& env_key,
                 const T& default_value = T{}) const {
        if (const char* env_val = std::getenv(env_key.c_str())) {
            return convertStringToType<T>(env_val, get<T>(key, default_value));
        }
        return get<T>(key, default_value);
    }

    void loadEnvironmentVariables(const std::vector<std::string>& env_vars,
                                  const std::string& prefix = "") {
        for (const auto& var : env_vars) {
            std::string full_var = prefix.empty() ? var : prefix + "_" + var;
            const char* value = std::getenv(full_var.c_str());
            if (value) {
                setEnvironmentValue(envToKey(var), value);
            }
        }
    }

private:
    // REDIS_HOST -> redis.host
    static std::string envToKey(const std::string& var) {
        std::string key = toLowerCase(var);
        auto pos = key.find('_');
        if (pos != std::string::npos) {
            key[pos] = '.';
        }
        return key;
    }

    static json::json_pointer to_pointer(const std::string& key) {
        std::string path = "/" + key;
        boost::replace_all(path, ".", "/");
        return json::json_pointer(path);
    }

    void setEnvironmentValue(const std::string& key, const std::string& value) {
        config_[key] = value;
        try {
            auto pointer = to_pointer(key);
            if (isInteger(value)) {
                json_[pointer] = std::stoll(value);
            } else if (isBool(value)) {
                json_[pointer] = toBool(value);
            } else {
                json_[pointer] = value;
            }
        } catch (const std::exception&) {
            // keep the flattened string form only
        }
    }

    void flatten_json(const json& j, const std::string& parent_key,
                      std::unordered_map<std::string, std::string>& result) {
        if (j.is_object()) {
            for (auto& [key, value] : j.items()) {
                std::string new_key = parent_key.empty() ? key : parent_key + "." + key;
                flatten_json(value, new_key, result);
            }
        } else if (j.is_string()) {
            result[parent_key] = j.get<std::string>();
        } else {
            result[parent_key] = j.dump();
        }
    }

    template <typename T>
    static T convertStringToType(const std::string& str, const T& default_value) {
        try {
            if constexpr (std::is_same_v<T, std::string>) {
                return str;
            } else if constexpr (std::is_same_v<T, bool>) {
                return toBool(str);
            } else if constexpr (std::is_integral_v<T>) {
                return static_cast<T>(std::stoll(str));
            } else if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(std::stod(str));
            } else {
                return json::parse(str).get<T>();
            }
        } catch (const std::exception&) {
            return default_value;
        }
    }

    static bool isInteger(const std::string& str) {
        if (str.empty()) return false;
        size_t start = (str[0] == '-' || str[0] == '+') ? 1 : 0;
        if (start >= str.length()) return false;
        return std::all_of(str.begin() + start, str.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    static bool isBool(const std::string& str) {
        std::string lower_str = toLowerCase(str);
        return lower_str == "true" || lower_str == "false";
    }

    static bool toBool(const std::string& str) {
        std::string lower_str = toLowerCase(str);
        return lower_str == "true" || lower_str == "1" || lower_str == "yes" || lower_str == "on";
    }

    static std::string toLowerCase(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    std::string path_;
    std::unordered_map<std::string, std::string> config_;
    json json_;
};

}  // namespace utils
}  // namespace chatlive

#endif  // CHATLIVE_CONFIG_MGR_HPP
