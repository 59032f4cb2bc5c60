#pragma once
/**
 * @file provenance.hpp
 * @brief Derive a pod's origin and mirror/static status from its annotations.
 * @details Nothing here is cached: every call re-reads the annotation map.
 *          Writers that stamp provenance or create mirror pods must use the
 *          keys below verbatim.
 */

#include <string>
#include <string_view>

#include "podcfg/compat/expected.hpp"
#include "podcfg/types/errors.hpp"
#include "podcfg/types/pod.hpp"

namespace podcfg::policy {

/// Source the pod configuration came from (file, http or api).
inline constexpr std::string_view CONFIG_SOURCE_ANNOTATION_KEY     = "kubernetes.io/config.source";
/// Present on mirror pods; the value is not interpreted here.
inline constexpr std::string_view CONFIG_MIRROR_ANNOTATION_KEY     = "kubernetes.io/config.mirror";
/// Time the node agent first saw the pod.
inline constexpr std::string_view CONFIG_FIRST_SEEN_ANNOTATION_KEY = "kubernetes.io/config.seen";
/// Hash of the pod manifest as read from its source.
inline constexpr std::string_view CONFIG_HASH_ANNOTATION_KEY       = "kubernetes.io/config.hash";

/**
 * @brief Read the provenance annotation.
 * @return The stored source, or TypesErr::SourceUnknown carrying the pod UID.
 */
podcfg_detail::expected<std::string, types::TypesError>
pod_source(const types::Pod& pod);

/// @return true iff the mirror annotation is present, whatever its value.
[[nodiscard]] bool is_mirror_pod(const types::Pod& pod) noexcept;

/**
 * @brief A pod is static when its source is known and is not the API server.
 * @note A pod without provenance is not static; the lookup failure is not propagated.
 */
[[nodiscard]] bool is_static_pod(const types::Pod& pod);

} // namespace podcfg::policy
