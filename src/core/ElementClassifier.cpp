#include "core/ElementClassifier.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>

namespace core {

namespace {

constexpr std::array<const char*, 8> kInputRoles = {
    "AXTextField",
    "AXTextArea",
    "AXButton",
    "AXCheckBox",
    "AXRadioButton",
    "AXSlider",
    "AXComboBox",
    "AXPopUpButton",
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Whole token must be a decimal number; strtod alone would accept " 5",
// "5abc" and hex floats. Out-of-range values keep strtod's result
// (+-HUGE_VAL on overflow, the subnormal or zero on underflow).
bool parse_number(const std::string& token, double& out) {
    if (token.empty() || std::isspace(static_cast<unsigned char>(token.front())) ||
        token.find_first_of("xX") != std::string::npos) {
        return false;
    }
    const char* begin = token.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end != begin + token.size()) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

ElementClassifier::ElementClassifier(std::string self_app_name)
    : self_name_lower_(to_lower(std::move(self_app_name))) {}

bool ElementClassifier::is_input_capable(const std::string& kind) {
    return std::any_of(kInputRoles.begin(), kInputRoles.end(),
                       [&kind](const char* role) { return ends_with(kind, role); });
}

std::optional<common::Frame> ElementClassifier::selected_text_bounds(
    const common::Attributes& attributes
) {
    auto it = attributes.find(kSelectedTextBoundsAttribute);
    if (it == attributes.end()) {
        return std::nullopt;
    }

    const std::string& value = it->second;
    std::array<double, 4> parts{};
    size_t count = 0;
    size_t start = 0;

    while (true) {
        size_t comma = value.find(',', start);
        std::string token = value.substr(start, comma == std::string::npos ? std::string::npos
                                                                            : comma - start);
        if (count == parts.size() || !parse_number(token, parts[count])) {
            return std::nullopt;
        }
        ++count;
        if (comma == std::string::npos) break;
        start = comma + 1;
    }

    if (count != parts.size()) {
        return std::nullopt;
    }
    return common::Frame{parts[0], parts[1], parts[2], parts[3]};
}

bool ElementClassifier::is_self(const common::Element& element) const {
    if (!element.owning_application) {
        return false;
    }
    return to_lower(*element.owning_application).find(self_name_lower_) != std::string::npos;
}

void ElementClassifier::collect_input_elements(const common::Element& root,
                                               std::vector<common::Element>& out) {
    if (is_input_capable(root.kind)) {
        out.push_back(root);
    }
    for (const auto& child : root.children) {
        collect_input_elements(child, out);
    }
}

} // namespace core
