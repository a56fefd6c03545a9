#include "core/PollingSession.hpp"
#include "core/TreeDecoder.hpp"

namespace core {

    PollingSession::PollingSession(
        std::shared_ptr<HierarchyBridge> bridge,
        std::shared_ptr<AccessibilityContext> context,
        PollingOptions options,
        std::shared_ptr<common::ILogger> logger
    ) : bridge_(std::move(bridge)),
        context_(std::move(context)),
        options_(std::move(options)),
        classifier_(options_.self_app_name),
        logger_(std::move(logger)) {}

    PollingSession::~PollingSession() {
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (state_.load() == PollingState::Running) {
                state_.store(PollingState::Stopping);
            }
            cancel_source_.cancel();
        }
        // The worker takes the lifecycle mutex on its way out
        join_worker();
    }

    common::EmptyResult PollingSession::start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);

        if (state_.load() == PollingState::Running) {
            logger_->info("[PollingSession] Already running, start ignored");
            return common::EmptyResult::success();
        }

        // The old worker is still inside its last tick. Hand it a fresh token
        // and let it carry on instead of waiting for the native call.
        if (state_.load() == PollingState::Stopping) {
            cancel_source_.reset();
            state_.store(PollingState::Running);
            logger_->info("[PollingSession] Polling resumed before the worker exited");
            return common::EmptyResult::success();
        }

        // Idle: any previous worker has already left its loop
        join_worker();

        cancel_source_.reset();
        state_.store(PollingState::Running);

        try {
            worker_thread_ = std::thread(&PollingSession::worker_routine, this, cancel_source_.get_token());
        } catch (const std::exception& e) {
            state_.store(PollingState::Idle);
            return common::EmptyResult::err(common::ErrorCode::Unknown, e.what(), AXWATCH_LOCATION);
        }

        workers_spawned_.fetch_add(1);
        logger_->info("[PollingSession] Polling started (interval " +
                      std::to_string(options_.interval.count()) + "ms)");
        return common::EmptyResult::success();
    }

    void PollingSession::stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);

        if (state_.load() != PollingState::Running) return;

        state_.store(PollingState::Stopping);
        cancel_source_.cancel();
        logger_->info("[PollingSession] Stop requested");
    }

    void PollingSession::join_worker() {
        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
    }

    void PollingSession::worker_routine(common::CancellationToken token) {
        logger_->debug("[PollingSession] Worker thread started.");

        while (true) {
            try {
                TickReport report = run_tick();
                if (listener_) listener_(report);
            } catch (const std::exception& e) {
                // A bad tick must not end the loop
                logger_->error(std::string("[PollingSession] Tick failed: ") + e.what());
            }

            token.sleep_for(options_.interval);

            // Exit decision and re-arm pick-up happen under the lifecycle mutex
            // so start() never sees a worker that is about to leave.
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (state_.load() != PollingState::Running) {
                state_.store(PollingState::Idle);
                break;
            }
            token = cancel_source_.get_token();
        }

        logger_->debug("[PollingSession] Worker thread exited.");
    }

    TickReport PollingSession::run_tick() {
        TickReport report;

        // 1. Scope the request by the last foreign application, if any
        auto last = context_->selection.read();
        if (last) {
            report.app_filter = last->app_element.owning_application;
        }

        // 2. Snapshot (blocks on a pool worker) and decode
        std::string raw = bridge_->fetch(report.app_filter, std::nullopt);
        auto decoded = TreeDecoder::decode(raw);
        if (decoded.is_err()) {
            logger_->debug(std::string("[PollingSession] Skipping tick: ") +
                           common::to_string(decoded.error().code) + ": " + decoded.error().message);
            return report;
        }
        report.decoded = true;
        const common::Tree& tree = decoded.unwrap();

        // 3. Track the foreign root and collect its input elements
        for (const auto& root : tree.roots) {
            if (classifier_.is_self(root)) {
                report.self_focused = true;
                break;
            }
            context_->selection.write(common::SelectionContext{root});
            ElementClassifier::collect_input_elements(root, report.input_elements);
        }

        // 4. Selection overlays, keyed by position in the collection
        for (size_t idx = 0; idx < report.input_elements.size(); ++idx) {
            auto bounds = ElementClassifier::selected_text_bounds(report.input_elements[idx].attributes);
            if (!bounds) continue;

            std::string label = "overlay_" + std::to_string(idx) + "_selection";
            report.labels.insert(label);
            report.overlays.push_back(common::OverlayCandidate{label, *bounds});
        }
        context_->overlays.publish(report.overlays);

        logger_->debug("[PollingSession] Tick: " + std::to_string(tree.roots.size()) + " roots, " +
                       std::to_string(report.input_elements.size()) + " inputs, " +
                       std::to_string(report.overlays.size()) + " overlays" +
                       (report.self_focused ? " (self focused)" : ""));
        return report;
    }

} // namespace core
