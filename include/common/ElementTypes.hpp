#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace common {

    // Screen-space rectangle (x, y, width, height)
    struct Frame {
        double x = 0;
        double y = 0;
        double width = 0;
        double height = 0;

        bool operator==(const Frame& o) const {
            return x == o.x && y == o.y && width == o.width && height == o.height;
        }
        bool operator!=(const Frame& o) const { return !(*this == o); }
    };

    using Attributes = std::map<std::string, std::string>;

    // One node of the accessibility hierarchy. Children are owned by value.
    struct Element {
        std::optional<std::string> identifier;
        std::string kind;                      // AX role, e.g. "AXButton"
        std::optional<std::string> path;
        std::optional<uint32_t> depth;
        std::optional<Frame> frame;
        Attributes attributes;
        std::vector<std::string> actions;
        std::vector<Element> children;
        std::optional<std::string> owning_application;
        std::optional<bool> is_focused;

        // Only set on window roots
        std::optional<bool> is_main;
        std::optional<bool> app_active;

        bool operator==(const Element& o) const {
            return identifier == o.identifier && kind == o.kind && path == o.path &&
                   depth == o.depth && frame == o.frame && attributes == o.attributes &&
                   actions == o.actions && children == o.children &&
                   owning_application == o.owning_application && is_focused == o.is_focused &&
                   is_main == o.is_main && app_active == o.app_active;
        }
        bool operator!=(const Element& o) const { return !(*this == o); }
    };

    struct Tree {
        std::vector<Element> roots;
        std::optional<std::string> timestamp;

        bool operator==(const Tree& o) const {
            return roots == o.roots && timestamp == o.timestamp;
        }
        bool operator!=(const Tree& o) const { return !(*this == o); }
    };

    // Most recent application root that did not belong to the hosting app
    struct SelectionContext {
        Element app_element;
    };

    struct OverlayCandidate {
        std::string label;   // overlay_<index>_selection
        Frame bounds;
    };

    // Flat record returned by fetch_ui_elements
    struct UIElementSummary {
        std::string role;
        std::string label;
        std::string value;
        double x = 0;
        double y = 0;
    };

} // namespace common
