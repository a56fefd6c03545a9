#pragma once
#include <optional>
#include <string>
#include <vector>
#include "common/ElementTypes.hpp"

namespace core {

// Attribute carrying the selected-text rectangle as "x,y,width,height"
inline constexpr const char* kSelectedTextBoundsAttribute = "AXSelectedTextBounds";

// ============================================================================
// ElementClassifier - decides what the polling loop cares about
// ============================================================================
// Pure predicates over the element model. The only state is the hosting
// application's name, used to recognise our own windows.
// ============================================================================

class ElementClassifier {
public:
    explicit ElementClassifier(std::string self_app_name);

    // True iff `kind` ends with one of the input role suffixes
    // (AXTextField, AXTextArea, AXButton, AXCheckBox, AXRadioButton,
    //  AXSlider, AXComboBox, AXPopUpButton). Case-sensitive.
    static bool is_input_capable(const std::string& kind);

    // Exactly four comma-separated decimal numbers under
    // AXSelectedTextBounds, otherwise nullopt. Overflow parses as infinity.
    static std::optional<common::Frame> selected_text_bounds(const common::Attributes& attributes);

    // True iff the element's application name contains ours. Case folding is
    // ASCII-only: bytes outside A-Z are compared as-is, so non-ASCII names
    // must match exactly in case.
    bool is_self(const common::Element& element) const;

    // Appends `root` and all its descendants that are input-capable, pre-order
    static void collect_input_elements(const common::Element& root,
                                       std::vector<common::Element>& out);

    const std::string& self_app_name() const { return self_name_lower_; }

private:
    std::string self_name_lower_;
};

} // namespace core
