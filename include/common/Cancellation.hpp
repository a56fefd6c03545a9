#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace common {

    // The Token (View) - Passed to workers
    class CancellationToken {
        struct State {
            std::atomic<bool> requested{false};
            std::mutex wait_mutex;
            std::condition_variable wake;
        };
        std::shared_ptr<State> state;

    public:
        CancellationToken() : state(std::make_shared<State>()) {}

        // Check with ACQUIRE memory order (sees writes from owner)
        bool is_cancellation_requested() const {
            return state && state->requested.load(std::memory_order_acquire);
        }

        // Sleeps for `delay` unless cancellation is requested first.
        // Returns false when woken by cancellation.
        template <typename Rep, typename Period>
        bool sleep_for(const std::chrono::duration<Rep, Period>& delay) const {
            if (!state) return false;
            std::unique_lock<std::mutex> lock(state->wait_mutex);
            bool cancelled = state->wake.wait_for(lock, delay, [this]() {
                return state->requested.load(std::memory_order_acquire);
            });
            return !cancelled;
        }

        friend class CancellationSource;
    };

    // The Source (Owner) - Held by controller
    class CancellationSource {
        CancellationToken token;

    public:
        // Set with RELEASE memory order, then wake any sleeping worker
        void cancel() {
            if (!token.state) return;
            {
                std::lock_guard<std::mutex> lock(token.state->wait_mutex);
                token.state->requested.store(true, std::memory_order_release);
            }
            token.state->wake.notify_all();
        }

        CancellationToken get_token() const { return token; }

        // Tokens handed out earlier keep the old (cancelled) state
        void reset() {
            token = CancellationToken();
        }
    };

} // namespace common
