#pragma once
/**
 * @file errors.hpp
 * @brief Error vocabulary for source validation and provenance lookup.
 * @details Errors are returned through podcfg_detail::expected, never thrown.
 */

#include <cstdint>
#include <string>

namespace podcfg::types {

/// Result codes for source validation and provenance lookup.
enum class TypesErr : std::uint8_t {
    UnknownSource, ///< A configured source name is outside {file, http, api, *}.
    SourceUnknown  ///< A pod carries no provenance annotation.
};

/** @struct TypesError
 *  @brief Error code plus the value it refers to.
 */
struct TypesError {
    TypesErr    code{TypesErr::UnknownSource}; ///< What went wrong
    std::string subject;                       ///< Offending source name or pod UID

    bool operator==(const TypesError&) const = default;
};

/// Render a human-readable message, e.g. `unknown pod source "bogus"`.
std::string describe(const TypesError& err);

} // namespace podcfg::types
