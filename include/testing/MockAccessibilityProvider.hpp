#pragma once
#include "interfaces/IAccessibilityProvider.hpp"
#include "interfaces/IElementScanner.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace testing {

    // Scripted provider. Replies are heap copies so every buffer handed out can
    // be matched against a release(). Safe to call from the polling worker.
    class MockAccessibilityProvider : public interfaces::IAccessibilityProvider {
    public:
        struct FilterCall {
            std::optional<std::string> app;
            std::optional<std::string> window;
        };

        struct ActionCall {
            std::string element_id;
            std::string argument;   // text or action name
        };

        MockAccessibilityProvider() = default;
        explicit MockAccessibilityProvider(std::string hierarchy) : hierarchy_(std::move(hierarchy)) {}

        // ========== Scripting ==========

        // nullopt makes the call return nullptr
        void set_hierarchy(std::optional<std::string> payload) {
            std::lock_guard<std::mutex> lock(mutex_);
            hierarchy_ = std::move(payload);
        }

        // One-shot payloads served before the default hierarchy
        void queue_hierarchy(std::string payload) {
            std::lock_guard<std::mutex> lock(mutex_);
            queued_.push_back(std::move(payload));
        }

        // While held, hierarchy calls park until release_hierarchy()
        void hold_hierarchy() {
            std::lock_guard<std::mutex> lock(gate_mutex_);
            held_ = true;
        }

        void release_hierarchy() {
            {
                std::lock_guard<std::mutex> lock(gate_mutex_);
                held_ = false;
            }
            gate_.notify_all();
        }

        void set_type_reply(std::optional<std::string> reply) {
            std::lock_guard<std::mutex> lock(mutex_);
            type_reply_ = std::move(reply);
        }

        void set_named_reply(std::optional<std::string> reply) {
            std::lock_guard<std::mutex> lock(mutex_);
            named_reply_ = std::move(reply);
        }

        // ========== IAccessibilityProvider ==========

        char* get_hierarchy() override {
            wait_at_gate();
            std::lock_guard<std::mutex> lock(mutex_);
            unfiltered_calls_++;
            return next_hierarchy();
        }

        char* get_hierarchy_filtered(const char* app_name, const char* window_title) override {
            wait_at_gate();
            std::lock_guard<std::mutex> lock(mutex_);
            FilterCall call;
            if (app_name) call.app = app_name;
            if (window_title) call.window = window_title;
            filtered_calls_.push_back(call);
            return next_hierarchy();
        }

        char* perform_type_action(const char* element_id, const char* text) override {
            std::lock_guard<std::mutex> lock(mutex_);
            type_calls_.push_back(ActionCall{element_id, text});
            return allocate(type_reply_);
        }

        char* perform_named_action(const char* element_id, const char* action_name) override {
            std::lock_guard<std::mutex> lock(mutex_);
            named_calls_.push_back(ActionCall{element_id, action_name});
            return allocate(named_reply_);
        }

        void release(char* buffer) noexcept override {
            if (!buffer) return;
            released_.fetch_add(1);
            std::free(buffer);
        }

        // ========== Inspection ==========

        int unfiltered_calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return unfiltered_calls_;
        }

        std::vector<FilterCall> filtered_calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return filtered_calls_;
        }

        std::vector<ActionCall> type_calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return type_calls_;
        }

        std::vector<ActionCall> named_calls() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return named_calls_;
        }

        // Hierarchy calls currently parked at the gate
        int parked_calls() const { return parked_.load(); }

        int allocated() const { return allocated_.load(); }
        int released() const { return released_.load(); }
        bool all_released() const { return allocated() == released(); }

        // A focused Notes window: one text area with a selection and a button
        static std::string demo_hierarchy() {
            return R"({"ts":"2024-01-01T00:00:00Z","e":[)"
                   R"({"id":"w1","e":"AXWindow","app":"Notes","main":true,"appActive":true,)"
                   R"("f":[0,0,800,600],"c":[)"
                   R"({"id":"t1","e":"AXTextArea","d":1,"focused":true,"f":[10,40,780,500],)"
                   R"("a":{"AXSelectedTextBounds":"120,80,64,18","AXValue":"Hello world"},)"
                   R"("m":["AXConfirm"]},)"
                   R"({"id":"b1","e":"AXButton","d":1,"f":[700,560,80,24],)"
                   R"("a":{"AXTitle":"Done"},"m":["AXPress"]}]}]})";
        }

    private:
        void wait_at_gate() {
            std::unique_lock<std::mutex> lock(gate_mutex_);
            if (!held_) return;
            parked_.fetch_add(1);
            gate_.wait(lock, [this]() { return !held_; });
            parked_.fetch_sub(1);
        }

        char* next_hierarchy() {
            if (!queued_.empty()) {
                std::optional<std::string> payload = std::move(queued_.front());
                queued_.pop_front();
                return allocate(payload);
            }
            return allocate(hierarchy_);
        }

        char* allocate(const std::optional<std::string>& payload) {
            if (!payload) return nullptr;
            char* buffer = static_cast<char*>(std::malloc(payload->size() + 1));
            if (!buffer) return nullptr;
            std::memcpy(buffer, payload->c_str(), payload->size() + 1);
            allocated_.fetch_add(1);
            return buffer;
        }

        mutable std::mutex mutex_;
        std::optional<std::string> hierarchy_;
        std::deque<std::string> queued_;
        std::optional<std::string> type_reply_;
        std::optional<std::string> named_reply_;

        int unfiltered_calls_ = 0;
        std::vector<FilterCall> filtered_calls_;
        std::vector<ActionCall> type_calls_;
        std::vector<ActionCall> named_calls_;

        std::mutex gate_mutex_;
        std::condition_variable gate_;
        bool held_ = false;
        std::atomic<int> parked_{0};

        std::atomic<int> allocated_{0};
        std::atomic<int> released_{0};
    };

    class MockElementScanner : public interfaces::IElementScanner {
    public:
        explicit MockElementScanner(std::vector<common::UIElementSummary> elements = {})
            : elements_(std::move(elements)) {}

        std::vector<common::UIElementSummary> scan_focused_window() override {
            return elements_;
        }

    private:
        std::vector<common::UIElementSummary> elements_;
    };

} // namespace testing
