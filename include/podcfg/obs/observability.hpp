#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: sync/update events + counters.
 * @details Consumed by the reconciliation loop, which labels every pass with a
 *          SyncPodType and every received update with its PodOperation.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include "podcfg/types/pod_update.hpp"
#include "podcfg/types/sync_pod_type.hpp"

namespace podcfg::obs {

    /// Number of known SyncPodType labels (Sync..Kill).
    inline constexpr std::size_t SYNC_TYPE_COUNT = 4;
    /// Number of known PodOperation kinds (Set..Reconcile).
    inline constexpr std::size_t POD_OPERATION_COUNT = 6;

    /** @struct Counters
     *  @brief Process-level counters, indexed by enum ordinal.
     */
    struct Counters {
        std::array<uint64_t, SYNC_TYPE_COUNT>     syncs_by_type{};  ///< Passes per SyncPodType
        std::array<uint64_t, POD_OPERATION_COUNT> updates_by_op{};  ///< Updates per PodOperation
        uint64_t pods_in_updates{0};  ///< Sum of pod counts over all updates
        uint64_t critical_syncs{0};   ///< Passes over critical pods
        uint64_t unknown_labels{0};   ///< Events carrying an out-of-range enum value
    };

    /** @struct SyncEvent
     *  @brief One reconciliation pass for one pod.
     */
    struct SyncEvent {
        std::string                pod_uid;         ///< Pod identifier
        podcfg::types::SyncPodType sync_type{podcfg::types::SyncPodType::Sync}; ///< Why the pass runs
        std::string                source;          ///< Provenance, empty if unknown
        bool                       critical{false}; ///< Result of CriticalityPolicy::is_critical_pod
        std::string                reason;          ///< Free-form label (for humans/logs)
    };

    /** @struct UpdateEvent
     *  @brief One PodUpdate received from a source.
     */
    struct UpdateEvent {
        std::string                 source;    ///< Originating source
        podcfg::types::PodOperation op{podcfg::types::PodOperation::Set}; ///< Operation kind
        std::size_t                 pod_count{0}; ///< Number of pods carried
    };

    /// Summarize an update for recording.
    UpdateEvent to_event(const podcfg::types::PodUpdate& update);

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single reconciliation pass.
        virtual void record(const SyncEvent& e) = 0;
        /// Record a single received update.
        virtual void record(const UpdateEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    // Process-wide printf-backed sink (implemented in .cpp)
    Observer* make_simple_observer();

} // namespace podcfg::obs
