#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the pod configuration policy layer.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader in deployments that run a non-standard priority-class setup.
 */

#include <cstdint>
#include <string_view>

namespace podcfg::config::constants {

// =====================
// Priority Classes
// Values mirror the cluster's built-in priority classes. User-defined classes
// may not exceed HIGHEST_USER_DEFINABLE_PRIORITY; system classes sit above it.
// =====================
inline constexpr int32_t HIGHEST_USER_DEFINABLE_PRIORITY = 1000000000; ///< 1e9
inline constexpr int32_t SYSTEM_CRITICAL_PRIORITY        = 2 * HIGHEST_USER_DEFINABLE_PRIORITY; ///< Critical threshold

/// Built-in class for pods that must never be evicted from their node.
inline constexpr std::string_view SYSTEM_NODE_CRITICAL    = "system-node-critical";
/// Built-in class for cluster-wide critical add-ons.
inline constexpr std::string_view SYSTEM_CLUSTER_CRITICAL = "system-cluster-critical";

// =====================
// Source Defaults
// =====================
inline constexpr std::string_view DEFAULT_POD_SOURCES = "*"; ///< Accept every source unless configured
inline constexpr char             POD_SOURCES_SEPARATOR = ','; ///< List separator for pod_sources
inline constexpr std::string_view POD_SOURCES_WHITESPACE = " \t\r\n\v\f"; ///< Trimmed around each pod_sources item

// =====================
// Config Keys (Loader::load_from_pairs)
// =====================
inline constexpr std::string_view KEY_POD_SOURCES              = "pod_sources";
inline constexpr std::string_view KEY_SYSTEM_CRITICAL_PRIORITY = "system_critical_priority";
inline constexpr std::string_view KEY_NODE_CRITICAL_CLASS_NAME = "node_critical_class_name";

} // namespace podcfg::config::constants
