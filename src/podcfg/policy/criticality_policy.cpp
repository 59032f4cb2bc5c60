/**
 * @file criticality_policy.cpp
 * @brief Implementation of CriticalityPolicy and init-container helpers.
 */
#include "podcfg/policy/criticality_policy.hpp"
#include "podcfg/policy/provenance.hpp"

namespace podcfg::policy {

bool CriticalityPolicy::is_critical_priority(int32_t priority) const noexcept {
    return priority >= cfg_.system_critical_priority;
}

bool CriticalityPolicy::is_critical_pod(const types::Pod& pod) const {
    // Cheapest first: one annotation lookup each, then the priority field.
    if (is_static_pod(pod)) return true;
    if (is_mirror_pod(pod)) return true;
    return pod.priority.has_value() && is_critical_priority(*pod.priority);
}

bool CriticalityPolicy::is_node_critical_pod(const types::Pod& pod) const {
    return is_critical_pod(pod) && pod.priority_class_name == cfg_.node_critical_class_name;
}

PreemptionDecision
CriticalityPolicy::evaluate_preemption(const types::Pod& preemptor,
                                       const types::Pod& preemptee) const {
    if (is_critical_pod(preemptor) && !is_critical_pod(preemptee)) {
        return PreemptionDecision{true, "critical_over_noncritical"};
    }
    if (preemptor.priority.has_value() && preemptee.priority.has_value()) {
        if (*preemptor.priority > *preemptee.priority) {
            return PreemptionDecision{true, "higher_priority"};
        }
        return PreemptionDecision{false, "not_higher_priority"};
    }
    // Missing priority information never grants preemption.
    return PreemptionDecision{false, "no_comparable_priority"};
}

bool CriticalityPolicy::preemptable(const types::Pod& preemptor, const types::Pod& preemptee) const {
    return evaluate_preemption(preemptor, preemptee).allowed;
}

bool is_restartable_init_container(const types::Container& container) noexcept {
    return container.restart_policy.has_value() &&
           *container.restart_policy == types::ContainerRestartPolicy::Always;
}

} // namespace podcfg::policy
