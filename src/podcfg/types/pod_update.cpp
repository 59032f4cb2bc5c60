/**
 * @file pod_update.cpp
 * @brief PodUpdate equality and operation labels.
 */
#include "podcfg/types/pod_update.hpp"
#include <algorithm>
#include <utility>

namespace podcfg::types {

static bool same_pod(const PodRef& a, const PodRef& b) noexcept {
    if (a == b) return true;     // same snapshot (or both null)
    if (!a || !b) return false;
    return *a == *b;
}

bool PodUpdate::operator==(const PodUpdate& other) const noexcept {
    return op == other.op && source == other.source &&
           std::equal(pods.begin(), pods.end(), other.pods.begin(), other.pods.end(), same_pod);
}

PodUpdate make_update(PodOperation op, std::string source, PodList pods) {
    return PodUpdate{std::move(pods), op, std::move(source)};
}

std::string_view to_string(PodOperation op) noexcept {
    switch (op) {
        case PodOperation::Set:       return "SET";
        case PodOperation::Add:       return "ADD";
        case PodOperation::Delete:    return "DELETE";
        case PodOperation::Remove:    return "REMOVE";
        case PodOperation::Update:    return "UPDATE";
        case PodOperation::Reconcile: return "RECONCILE";
    }
    return "UNKNOWN";
}

} // namespace podcfg::types
