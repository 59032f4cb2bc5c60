#pragma once
/**
 * @file pod_source.hpp
 * @brief Closed set of configuration source names and their validation.
 */

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "podcfg/compat/expected.hpp"
#include "podcfg/types/errors.hpp"

namespace podcfg::types {

/// Updates read from a manifest directory on the node.
inline constexpr std::string_view FILE_SOURCE      = "file";
/// Updates from polling a manifest URL.
inline constexpr std::string_view HTTP_SOURCE      = "http";
/// Updates from the cluster API server.
inline constexpr std::string_view APISERVER_SOURCE = "api";
/// Wildcard that expands to every source above.
inline constexpr std::string_view ALL_SOURCE       = "*";

/// @return The canonical expansion of ALL_SOURCE: file, http, api.
std::vector<std::string> all_sources();

/// @return true if @p name is one of file, http or api. The wildcard is not a concrete source.
[[nodiscard]] bool is_known_source(std::string_view name) noexcept;

/**
 * @brief Validate and expand a list of configured source names.
 * @details
 *  - The first ALL_SOURCE short-circuits: the result is all_sources() and the
 *    remaining input is not inspected.
 *  - Concrete names are kept in input order. Duplicates are kept.
 *  - Empty strings are skipped.
 *  - Anything else fails with TypesErr::UnknownSource naming the value.
 * @param sources Names as configured by the operator.
 * @return Validated names, or the first error.
 */
podcfg_detail::expected<std::vector<std::string>, TypesError>
validated_sources(std::span<const std::string> sources);

} // namespace podcfg::types
