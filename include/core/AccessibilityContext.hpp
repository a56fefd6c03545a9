#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/ElementTypes.hpp"

namespace core {

// ============================================================================
// SelectionContextStore - last non-self application root
// ============================================================================
// Reads copy out, writes replace wholesale. Both under one mutex so a reader
// never sees a half-written Element. There is no clear(): the context lives
// until the process exits.
// ============================================================================

class SelectionContextStore {
public:
    std::optional<common::SelectionContext> read() const;
    void write(common::SelectionContext context);

private:
    mutable std::mutex mutex_;
    std::optional<common::SelectionContext> context_;
};

// ============================================================================
// OverlayBoard - selection overlays found by the latest decoded tick
// ============================================================================

class OverlayBoard {
public:
    void publish(std::vector<common::OverlayCandidate> candidates);

    std::vector<common::OverlayCandidate> current() const;

private:
    mutable std::mutex mutex_;
    std::vector<common::OverlayCandidate> candidates_;
};

// Shared state handed to the polling session at construction
struct AccessibilityContext {
    SelectionContextStore selection;
    OverlayBoard overlays;
};

} // namespace core
