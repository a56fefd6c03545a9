#include "core/AccessibilityContext.hpp"

namespace core {

std::optional<common::SelectionContext> SelectionContextStore::read() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_;
}

void SelectionContextStore::write(common::SelectionContext context) {
    std::lock_guard<std::mutex> lock(mutex_);
    context_ = std::move(context);
}

void OverlayBoard::publish(std::vector<common::OverlayCandidate> candidates) {
    std::lock_guard<std::mutex> lock(mutex_);
    candidates_ = std::move(candidates);
}

std::vector<common::OverlayCandidate> OverlayBoard::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return candidates_;
}

} // namespace core
