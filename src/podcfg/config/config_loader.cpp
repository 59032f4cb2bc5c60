/**
* @file config_loader.cpp
 * @brief Loader that starts from named defaults and applies caller-supplied pairs.
 */
#include "podcfg/config/config_loader.hpp"
#include "podcfg/config/constants.hpp"
#include "podcfg/types/pod_source.hpp"

#include <charconv>
#include <string_view>
#include <utility>

namespace podcfg::config {
    using namespace podcfg::config::constants;

    namespace {

        using Unexpected = podcfg_detail::unexpected<ConfigError>;

        std::vector<std::string> split_sources(std::string_view raw) {
            std::vector<std::string> out;
            std::size_t start = 0;
            while (start <= raw.size()) {
                const auto end = raw.find(POD_SOURCES_SEPARATOR, start);
                auto item = raw.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
                // trim whitespace; an all-blank item becomes the empty placeholder
                const auto first = item.find_first_not_of(POD_SOURCES_WHITESPACE);
                item = (first == std::string_view::npos)
                    ? std::string_view{}
                    : item.substr(first, item.find_last_not_of(POD_SOURCES_WHITESPACE) - first + 1);
                out.emplace_back(item);
                if (end == std::string_view::npos) break;
                start = end + 1;
            }
            return out;
        }

        podcfg_detail::expected<std::vector<std::string>, ConfigError>
        parse_sources(const std::string& key, const std::string& value) {
            const auto raw = split_sources(value);
            auto validated = podcfg::types::validated_sources(raw);
            if (!validated) {
                return Unexpected(ConfigError{ConfigErr::InvalidSource, key, validated.error().subject});
            }
            return std::move(*validated);
        }

        podcfg_detail::expected<int32_t, ConfigError>
        parse_int32(const std::string& key, const std::string& value) {
            int32_t out{0};
            const char* first = value.data();
            const char* last  = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(first, last, out);
            if (value.empty() || ec != std::errc{} || ptr != last) {
                return Unexpected(ConfigError{ConfigErr::InvalidNumber, key, value});
            }
            return out;
        }

    } // namespace

    std::string describe(const ConfigError& err) {
        switch (err.code) {
            case ConfigErr::UnknownKey:
                return "unknown config key \"" + err.key + "\"";
            case ConfigErr::InvalidNumber:
                return "invalid integer \"" + err.value + "\" for " + err.key;
            case ConfigErr::InvalidSource:
                return "unknown pod source \"" + err.value + "\" in " + err.key;
        }
        return "unknown config error";
    }

    PodConfig Loader::defaults() {
        PodConfig pc;
        const auto raw = split_sources(DEFAULT_POD_SOURCES);
        pc.sources = podcfg::types::validated_sources(raw).value_or(podcfg::types::all_sources());
        pc.criticality = podcfg::policy::CriticalityConfig{}; // picks defaults from constants
        return pc;
    }

    podcfg_detail::expected<PodConfig, ConfigError> Loader::load_from_pairs(const KeyValues& pairs) {
        PodConfig pc = defaults();
        for (const auto& [key, value] : pairs) {
            if (key == KEY_POD_SOURCES) {
                auto sources = parse_sources(key, value);
                if (!sources) return Unexpected(sources.error());
                pc.sources = std::move(*sources);
            } else if (key == KEY_SYSTEM_CRITICAL_PRIORITY) {
                auto threshold = parse_int32(key, value);
                if (!threshold) return Unexpected(threshold.error());
                pc.criticality.system_critical_priority = *threshold;
            } else if (key == KEY_NODE_CRITICAL_CLASS_NAME) {
                pc.criticality.node_critical_class_name = value;
            } else {
                return Unexpected(ConfigError{ConfigErr::UnknownKey, key, value});
            }
        }
        return pc;
    }

} // namespace podcfg::config
