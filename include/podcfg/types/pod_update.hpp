#pragma once
/**
 * @file pod_update.hpp
 * @brief Message contract every configuration source uses to report changes.
 *
 * A source adds or removes single pods by sending a PodUpdate with one entry
 * and Op Add or Remove (with Remove only the UID matters). To reset the desired
 * state of a source, send the full set with Op Set; to remove every pod of that
 * source, send Set with an empty list.
 *
 * `pods` is a vector and therefore never absent. Consumers diff updates
 * structurally, so "no pods" has exactly one representation.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "podcfg/types/pod.hpp"

namespace podcfg::types {

/**
 * @enum PodOperation
 * @brief What a PodUpdate does to the desired state of its source.
 */
enum class PodOperation : std::uint8_t {
    Set = 0,   ///< Full desired set for the source
    Add,       ///< Pods new to this source
    Delete,    ///< Pods gracefully deleted from this source
    Remove,    ///< Pods removed from this source
    Update,    ///< Pods updated in this source
    Reconcile  ///< Pods with unexpected status; reconcile status, not desired state
};

/** @struct PodUpdate
 *  @brief One operation on the desired pod state of a single source.
 */
struct PodUpdate {
    PodList      pods;                    ///< Affected pods, in source order
    PodOperation op{PodOperation::Set};   ///< Exactly one operation per message
    std::string  source;                  ///< Originating source name

    /// Structural equality: pods are compared by value, not by pointer.
    bool operator==(const PodUpdate& other) const noexcept;
};

/**
 * @brief Build an update.
 * @param op Operation kind.
 * @param source Originating source name.
 * @param pods Affected pods; defaults to an empty list.
 */
PodUpdate make_update(PodOperation op, std::string source, PodList pods = {});

/// @return "SET", "ADD", "DELETE", "REMOVE", "UPDATE", "RECONCILE", or "UNKNOWN".
std::string_view to_string(PodOperation op) noexcept;

} // namespace podcfg::types
