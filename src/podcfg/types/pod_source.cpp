/**
 * @file pod_source.cpp
 * @brief Source name validation.
 */
#include "podcfg/types/pod_source.hpp"

namespace podcfg::types {

std::vector<std::string> all_sources() {
    return {std::string(FILE_SOURCE), std::string(HTTP_SOURCE), std::string(APISERVER_SOURCE)};
}

bool is_known_source(std::string_view name) noexcept {
    return name == FILE_SOURCE || name == HTTP_SOURCE || name == APISERVER_SOURCE;
}

podcfg_detail::expected<std::vector<std::string>, TypesError>
validated_sources(std::span<const std::string> sources) {
    std::vector<std::string> validated;
    validated.reserve(sources.size());
    for (const auto& source : sources) {
        if (source == ALL_SOURCE) return all_sources(); // wildcard wins, rest is ignored
        if (source.empty()) continue;
        if (!is_known_source(source)) {
            return podcfg_detail::unexpected<TypesError>(TypesError{TypesErr::UnknownSource, source});
        }
        validated.push_back(source);
    }
    return validated;
}

} // namespace podcfg::types
