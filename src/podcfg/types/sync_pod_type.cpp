#include "podcfg/types/sync_pod_type.hpp"

namespace podcfg::types {

std::string_view to_string(SyncPodType type) noexcept {
    switch (type) {
        case SyncPodType::Create: return "create";
        case SyncPodType::Update: return "update";
        case SyncPodType::Sync:   return "sync";
        case SyncPodType::Kill:   return "kill";
    }
    return "unknown";
}

} // namespace podcfg::types
