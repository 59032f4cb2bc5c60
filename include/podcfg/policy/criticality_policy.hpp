#pragma once
/**
 * @file criticality_policy.hpp
 * @brief Criticality classification and preemption decisions for the eviction path.
 * @details Thresholds are injected via CriticalityConfig; defaults live in constants.hpp.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "podcfg/config/constants.hpp"
#include "podcfg/types/pod.hpp"

namespace podcfg::policy {

/** @struct CriticalityConfig
 *  @brief Priority-class parameters owned by the cluster's priority policy.
 */
struct CriticalityConfig {
    int32_t     system_critical_priority{podcfg::config::constants::SYSTEM_CRITICAL_PRIORITY}; ///< Critical threshold (inclusive)
    std::string node_critical_class_name{podcfg::config::constants::SYSTEM_NODE_CRITICAL};     ///< Class marking node-critical pods

    bool operator==(const CriticalityConfig&) const = default;
};

/** @struct PreemptionDecision
 *  @brief Outcome of a preemption evaluation.
 */
struct PreemptionDecision {
    bool             allowed{false}; ///< Whether the preemptor may evict the preemptee
    std::string_view reason;         ///< Observability label
};

/** @class CriticalityPolicy
 *  @brief Decides which pods are protected and which may preempt others.
 *
 *  Immutable after construction; safe for concurrent readers.
 */
class CriticalityPolicy {
public:
    /// Construct with the built-in priority classes.
    CriticalityPolicy() = default;

    /// Construct with configuration.
    explicit CriticalityPolicy(CriticalityConfig cfg) noexcept : cfg_(std::move(cfg)) {}

    /// @return true iff @p priority is at or above the critical threshold.
    [[nodiscard]] bool is_critical_priority(int32_t priority) const noexcept;

    /**
     * @brief A pod is critical if it is static, a mirror pod, or has a critical priority.
     * @details Checks run in that order and stop at the first hit.
     */
    [[nodiscard]] bool is_critical_pod(const types::Pod& pod) const;

    /// @return true iff the pod is critical and requested the node-critical class.
    [[nodiscard]] bool is_node_critical_pod(const types::Pod& pod) const;

    /**
     * @brief Evaluate whether @p preemptor may preempt @p preemptee.
     * @details
     *  1. Critical over non-critical is always allowed.
     *  2. Otherwise both priorities must be set and the preemptor's must be strictly greater.
     *  3. Otherwise preemption is denied.
     */
    PreemptionDecision evaluate_preemption(const types::Pod& preemptor,
                                           const types::Pod& preemptee) const;

    /// Shorthand for evaluate_preemption(...).allowed.
    [[nodiscard]] bool preemptable(const types::Pod& preemptor, const types::Pod& preemptee) const;

    /// @return Current configuration (by const reference).
    const CriticalityConfig& config() const noexcept { return cfg_; }

private:
    CriticalityConfig cfg_{}; ///< Read-only for the lifetime of the policy
};

/// @return true iff the init container declares restart policy Always.
[[nodiscard]] bool is_restartable_init_container(const types::Container& container) noexcept;

} // namespace podcfg::policy
