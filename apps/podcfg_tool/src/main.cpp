// apps/podcfg_tool/src/main.cpp
// podcfg — podcfg_tool
// Purpose: Standalone helper for checking a node's pod configuration settings
// and previewing how the criticality policy classifies a few reference pods.
// This is NOT the node agent; it is a demo/testing utility.
//
// Usage example:
//   ./podcfg_tool pod_sources=file,api system_critical_priority=2000000000
//
// Notes:
// - Every argument must be key=value; keys are those accepted by Loader::load_from_pairs.
// - Exits with status 1 and the rendered error if the configuration is rejected.

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "podcfg/config/config_loader.hpp"
#include "podcfg/obs/observability.hpp"
#include "podcfg/policy/criticality_policy.hpp"
#include "podcfg/policy/provenance.hpp"
#include "podcfg/types/pod_source.hpp"
#include "podcfg/types/pod_update.hpp"
#include "podcfg/version.hpp"

using podcfg::types::Pod;
using podcfg::types::PodOperation;
using podcfg::types::PodRef;
using podcfg::types::SyncPodType;

static PodRef reference_pod(std::string uid, std::string source, bool mirror, int32_t priority) {
    auto pod = std::make_shared<Pod>();
    pod->uid = uid;
    pod->name = std::move(uid);
    pod->annotations.emplace(podcfg::policy::CONFIG_SOURCE_ANNOTATION_KEY, std::move(source));
    if (mirror) pod->annotations.emplace(podcfg::policy::CONFIG_MIRROR_ANNOTATION_KEY, "");
    pod->priority = priority;
    return pod;
}

int main(int argc, char** argv) {
    podcfg::config::KeyValues pairs;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto eq = arg.find('=');
        if (eq == std::string::npos) {
            std::cerr << "podcfg_tool: expected key=value, got \"" << arg << "\"" << std::endl;
            return 1;
        }
        pairs[arg.substr(0, eq)] = arg.substr(eq + 1);
    }

    const auto cfg = podcfg::config::Loader::load_from_pairs(pairs);
    if (!cfg) {
        std::cerr << "podcfg_tool: " << podcfg::config::describe(cfg.error()) << std::endl;
        return 1;
    }

    std::cout << "podcfg_tool " << podcfg::version_string << std::endl;
    std::cout << "sources:";
    for (const auto& s : cfg->sources) std::cout << ' ' << s;
    std::cout << std::endl;
    std::cout << "system_critical_priority: " << cfg->criticality.system_critical_priority << std::endl;
    std::cout << "node_critical_class_name: " << cfg->criticality.node_critical_class_name << std::endl;

    const podcfg::policy::CriticalityPolicy policy{cfg->criticality};
    auto* observer = podcfg::obs::make_simple_observer();

    const podcfg::types::PodList pods{
        reference_pod("static-etcd", "file", false, 0),
        reference_pod("mirror-etcd", "api", true, 0),
        reference_pod("workload", "api", false, 1000),
    };
    const auto update = podcfg::types::make_update(PodOperation::Set, std::string(podcfg::types::APISERVER_SOURCE), pods);
    observer->record(podcfg::obs::to_event(update));

    for (const auto& pod : update.pods) {
        podcfg::obs::SyncEvent ev;
        ev.pod_uid   = pod->uid;
        ev.sync_type = SyncPodType::Create;
        ev.source    = podcfg::policy::pod_source(*pod).value_or("");
        ev.critical  = policy.is_critical_pod(*pod);
        ev.reason    = podcfg::policy::is_static_pod(*pod) ? "static" : "preview";
        observer->record(ev);
    }

    const auto decision = policy.evaluate_preemption(*pods[0], *pods[2]);
    std::cout << "static-etcd may preempt workload: " << (decision.allowed ? "yes" : "no")
              << " (" << decision.reason << ")" << std::endl;
    return 0;
}
