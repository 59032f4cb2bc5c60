/**
 * @file pod.hpp
 * @brief Pod model shared by the update contract and the policy components.
 *
 * Pods are owned by the cluster API layer; this library only reads them.
 * The model carries just the fields the classifiers depend on. Instances are
 * handed around as `PodRef` (shared pointer to const) so one snapshot can be
 * referenced from several updates without copying.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace podcfg::types {

/// Namespace assigned to pods whose manifest names none.
inline constexpr std::string_view NAMESPACE_DEFAULT = "default";

// Transparent hash/equal functors enable heterogeneous lookup with string_view
// (annotation keys are string_view constants; avoids std::string temporaries).
struct AnnotationKeyHash {
  using is_transparent = void;
  std::size_t operator()(std::string_view s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};
struct AnnotationKeyEq {
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept {
    return a == b;
  }
};

/// Free-form metadata attached to a pod. An empty map means "no annotations".
using Annotations =
    std::unordered_map<std::string, std::string, AnnotationKeyHash, AnnotationKeyEq>;

/**
 * @brief Per-container restart policy.
 *
 * @note Only meaningful on init containers. `Always` turns an init container
 *       into a sidecar that keeps running for the lifetime of the pod.
 */
enum class ContainerRestartPolicy : std::uint8_t {
  Always = 0
};

/**
 * @brief Minimal container descriptor.
 */
struct Container final {
  /// Container name, unique within the pod.
  std::string name;

  /// Declared restart policy; absent when the manifest omits it.
  std::optional<ContainerRestartPolicy> restart_policy;

  bool operator==(const Container&) const = default;
};

/**
 * @brief Immutable pod snapshot.
 *
 * Equality is defaulted so `PodUpdate` can compare pods by value.
 */
struct Pod final {
  /// Cluster-unique identifier.
  std::string uid;

  /// Object name, e.g. "kube-proxy-node1".
  std::string name;

  /// Object namespace.
  std::string namespace_name{NAMESPACE_DEFAULT};

  /// Metadata annotations (provenance, mirror marker, hash, first-seen).
  Annotations annotations;

  /// Resolved priority; absent until admission fills it in.
  std::optional<std::int32_t> priority;

  /// Name of the priority class the pod requested (may be empty).
  std::string priority_class_name;

  /// Init containers in declaration order.
  std::vector<Container> init_containers;

  bool operator==(const Pod&) const = default;
};

/// Shared read-only reference to a pod snapshot.
using PodRef = std::shared_ptr<const Pod>;

/// Ordered sequence of pod references.
using PodList = std::vector<PodRef>;

} // namespace podcfg::types
