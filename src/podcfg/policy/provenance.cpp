/**
 * @file provenance.cpp
 * @brief Annotation-based provenance lookups.
 */
#include "podcfg/policy/provenance.hpp"
#include "podcfg/types/pod_source.hpp"

namespace podcfg::policy {

podcfg_detail::expected<std::string, types::TypesError>
pod_source(const types::Pod& pod) {
    const auto it = pod.annotations.find(CONFIG_SOURCE_ANNOTATION_KEY);
    if (it == pod.annotations.end()) {
        return podcfg_detail::unexpected<types::TypesError>(
            types::TypesError{types::TypesErr::SourceUnknown, pod.uid});
    }
    return it->second;
}

bool is_mirror_pod(const types::Pod& pod) noexcept {
    return pod.annotations.find(CONFIG_MIRROR_ANNOTATION_KEY) != pod.annotations.end();
}

bool is_static_pod(const types::Pod& pod) {
    const auto source = pod_source(pod);
    return source.has_value() && *source != types::APISERVER_SOURCE;
}

} // namespace podcfg::policy
