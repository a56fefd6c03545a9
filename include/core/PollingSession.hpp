#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "common/Cancellation.hpp"
#include "common/ElementTypes.hpp"
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/AccessibilityContext.hpp"
#include "core/ElementClassifier.hpp"
#include "core/HierarchyBridge.hpp"

namespace core {

    enum class PollingState {
        Idle,
        Running,
        Stopping   // Cancel requested, worker finishing its current tick
    };

    // Outcome of one tick
    struct TickReport {
        bool decoded = false;           // Snapshot decoded (false: tick was a no-op)
        bool self_focused = false;      // A root belonged to the hosting app
        std::optional<std::string> app_filter;
        std::vector<common::Element> input_elements;
        std::vector<common::OverlayCandidate> overlays;
        std::set<std::string> labels;
    };

    struct PollingOptions {
        std::chrono::milliseconds interval{200};
        std::string self_app_name = "alvea";
    };

    class PollingSession {
    public:
        using TickListener = std::function<void(const TickReport&)>;

        PollingSession(
            std::shared_ptr<HierarchyBridge> bridge,
            std::shared_ptr<AccessibilityContext> context,
            PollingOptions options,
            std::shared_ptr<common::ILogger> logger
        );
        ~PollingSession();

        PollingSession(const PollingSession&) = delete;
        PollingSession& operator=(const PollingSession&) = delete;

        // Idle -> Running. Returns immediately. While Running this is a
        // no-op. While Stopping the worker still alive is re-armed rather
        // than replaced, so there is never more than one worker.
        common::EmptyResult start();

        // Running -> Stopping. Returns immediately; the worker exits at its
        // next iteration boundary (Stopping -> Idle). No-op unless Running.
        void stop();

        PollingState get_state() const { return state_.load(); }
        bool is_active() const { return get_state() == PollingState::Running; }

        // Number of worker threads spawned since construction
        uint64_t workers_spawned() const { return workers_spawned_.load(); }

        // One iteration without the trailing delay
        TickReport run_tick();

        // Must be set before start()
        void set_tick_listener(TickListener listener) { listener_ = std::move(listener); }

    private:
        void worker_routine(common::CancellationToken token);
        void join_worker();

    private:
        std::shared_ptr<HierarchyBridge> bridge_;
        std::shared_ptr<AccessibilityContext> context_;
        PollingOptions options_;
        ElementClassifier classifier_;
        std::shared_ptr<common::ILogger> logger_;
        TickListener listener_;

        std::mutex lifecycle_mutex_;
        std::atomic<PollingState> state_{PollingState::Idle};
        std::atomic<uint64_t> workers_spawned_{0};

        common::CancellationSource cancel_source_;
        std::thread worker_thread_;
    };

} // namespace core
