/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer.
 */
#include "podcfg/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace podcfg::obs {

    UpdateEvent to_event(const podcfg::types::PodUpdate& update) {
        return UpdateEvent{update.source, update.op, update.pods.size()};
    }

    class SimpleObserver : public Observer {
    public:
        void record(const SyncEvent& e) override {
            const auto idx = static_cast<std::size_t>(e.sync_type);
            const auto label = podcfg::types::to_string(e.sync_type);
            std::lock_guard<std::mutex> lk(mu_);
            if (idx < ctr_.syncs_by_type.size()) ctr_.syncs_by_type[idx]++;
            else ctr_.unknown_labels++;
            if (e.critical) ctr_.critical_syncs++;
            // JSON-ish line (swap for structured logger later)
            std::printf(
              R"({"event":"sync","pod":"%s","type":"%.*s","source":"%s","critical":%s,"reason":"%s"})" "\n",
              e.pod_uid.c_str(), static_cast<int>(label.size()), label.data(),
              e.source.c_str(), e.critical ? "true" : "false", e.reason.c_str());
            std::fflush(stdout);
        }
        void record(const UpdateEvent& e) override {
            const auto idx = static_cast<std::size_t>(e.op);
            const auto label = podcfg::types::to_string(e.op);
            std::lock_guard<std::mutex> lk(mu_);
            if (idx < ctr_.updates_by_op.size()) ctr_.updates_by_op[idx]++;
            else ctr_.unknown_labels++;
            ctr_.pods_in_updates += e.pod_count;
            std::printf(
              R"({"event":"update","source":"%s","op":"%.*s","pods":%zu})" "\n",
              e.source.c_str(), static_cast<int>(label.size()), label.data(), e.pod_count);
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace podcfg::obs
