#pragma once
/**
 * @file sync_pod_type.hpp
 * @brief Label describing why a reconciliation pass runs for a pod.
 */

#include <cstdint>
#include <string_view>

namespace podcfg::types {

/**
 * @enum SyncPodType
 * @brief One-shot label chosen per pass; carries no state.
 */
enum class SyncPodType : std::uint8_t {
    Sync = 0, ///< Periodic sync to ensure desired state
    Update,   ///< Pod was updated from its source
    Create,   ///< Pod was created from its source
    Kill      ///< Pod should have no running containers; may be restarted later
};

/// @return "sync", "update", "create", "kill", or "unknown" for any other value.
std::string_view to_string(SyncPodType type) noexcept;

} // namespace podcfg::types
