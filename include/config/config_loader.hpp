#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace wolfcache {

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * Reads wolfcache.toml. Every section and key is optional; missing values keep
 * the defaults from config_types.hpp.
 *
 * String values may reference the environment as ${VAR_NAME} (unset -> empty).
 * REDIS_URL and TIMESYNC_PORT override [cache].url and [server].port via
 * apply_env_overrides(); loading itself never reads them.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to wolfcache.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Range and consistency checks on a parsed config
     * @return One message per problem; empty if valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

    /// Apply REDIS_URL / TIMESYNC_PORT from the process environment
    static void apply_env_overrides(AppConfig& config);

private:
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace wolfcache
