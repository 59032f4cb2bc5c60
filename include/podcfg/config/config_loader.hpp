#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, overridden from key/value pairs.
 * @details The loader performs no I/O. Callers collect pairs from flags, a file
 *          or the environment and hand them over; all defaults reference named
 *          constants to avoid magic numbers.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "podcfg/compat/expected.hpp"
#include "podcfg/policy/criticality_policy.hpp"

namespace podcfg::config {

    /** @struct PodConfig
     *  @brief Aggregate of settings the node agent needs at startup.
     */
    struct PodConfig {
        std::vector<std::string>          sources;     ///< Validated pod sources
        podcfg::policy::CriticalityConfig criticality; ///< Priority thresholds
    };

    /// Result codes for configuration loading.
    enum class ConfigErr : std::uint8_t {
        UnknownKey,    ///< Key is not recognized.
        InvalidNumber, ///< Value is not a signed 32-bit integer.
        InvalidSource  ///< pod_sources names an unknown source.
    };

    /** @struct ConfigError
     *  @brief Error code plus the key/value pair that triggered it.
     */
    struct ConfigError {
        ConfigErr   code{ConfigErr::UnknownKey};
        std::string key;
        std::string value;
    };

    /// Render a human-readable message for operators.
    std::string describe(const ConfigError& err);

    /// Raw settings as collected by the caller.
    using KeyValues = std::map<std::string, std::string>;

    /** @class Loader
     *  @brief Source of pod configuration (defaults or caller-supplied pairs).
     */
    class Loader {
    public:
        /// @return Defaults with the wildcard source already expanded.
        static PodConfig defaults();

        /**
         * @brief Apply @p pairs on top of defaults().
         * @param pairs Keys pod_sources, system_critical_priority, node_critical_class_name.
         *        pod_sources is comma separated; each item is trimmed of spaces, tabs,
         *        CR, LF, VT and FF before validation, and blank items are skipped.
         * @return Loaded configuration, or the first error encountered.
         */
        static podcfg_detail::expected<PodConfig, ConfigError> load_from_pairs(const KeyValues& pairs);
    };

} // namespace podcfg::config
