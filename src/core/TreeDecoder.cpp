#include "core/TreeDecoder.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace core {

namespace {

using ElementResult = common::Result<common::Element>;

ElementResult malformed(const std::string& where, const std::string& what) {
    return ElementResult::err(common::ErrorCode::DecodeError, where + ": " + what);
}

common::Result<std::optional<std::string>> optional_string(
    const json& obj, const char* key, const std::string& where
) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return common::Result<std::optional<std::string>>::ok(std::nullopt);
    }
    if (!it->is_string()) {
        return common::Result<std::optional<std::string>>::err(
            common::ErrorCode::DecodeError, where + ": '" + key + "' is not a string");
    }
    return common::Result<std::optional<std::string>>::ok(it->get<std::string>());
}

common::Result<std::optional<bool>> optional_bool(
    const json& obj, const char* key, const std::string& where
) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return common::Result<std::optional<bool>>::ok(std::nullopt);
    }
    if (!it->is_boolean()) {
        return common::Result<std::optional<bool>>::err(
            common::ErrorCode::DecodeError, where + ": '" + key + "' is not a boolean");
    }
    return common::Result<std::optional<bool>>::ok(it->get<bool>());
}

ElementResult decode_element(const json& node, const std::string& where) {
    if (!node.is_object()) {
        return malformed(where, "element is not an object");
    }

    common::Element element;

    auto kind = node.find("e");
    if (kind == node.end() || !kind->is_string()) {
        return malformed(where, "missing element type 'e'");
    }
    element.kind = kind->get<std::string>();

    auto id = optional_string(node, "id", where);
    if (id.is_err()) return ElementResult::err(id.error());
    element.identifier = id.unwrap();

    auto path = optional_string(node, "p", where);
    if (path.is_err()) return ElementResult::err(path.error());
    element.path = path.unwrap();

    auto app = optional_string(node, "app", where);
    if (app.is_err()) return ElementResult::err(app.error());
    element.owning_application = app.unwrap();

    auto focused = optional_bool(node, "focused", where);
    if (focused.is_err()) return ElementResult::err(focused.error());
    element.is_focused = focused.unwrap();

    auto main = optional_bool(node, "main", where);
    if (main.is_err()) return ElementResult::err(main.error());
    element.is_main = main.unwrap();

    auto active = optional_bool(node, "appActive", where);
    if (active.is_err()) return ElementResult::err(active.error());
    element.app_active = active.unwrap();

    auto depth = node.find("d");
    if (depth != node.end() && !depth->is_null()) {
        if (!depth->is_number_unsigned() ||
            depth->get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
            return malformed(where, "'d' is not a non-negative integer");
        }
        element.depth = static_cast<uint32_t>(depth->get<uint64_t>());
    }

    auto frame = node.find("f");
    if (frame != node.end() && !frame->is_null()) {
        if (!frame->is_array() || frame->size() != 4) {
            return malformed(where, "'f' is not [x, y, width, height]");
        }
        for (const auto& v : *frame) {
            if (!v.is_number()) return malformed(where, "'f' holds a non-number");
        }
        element.frame = common::Frame{
            (*frame)[0].get<double>(), (*frame)[1].get<double>(),
            (*frame)[2].get<double>(), (*frame)[3].get<double>()
        };
    }

    auto attrs = node.find("a");
    if (attrs != node.end() && !attrs->is_null()) {
        if (!attrs->is_object()) return malformed(where, "'a' is not an object");
        for (auto it = attrs->begin(); it != attrs->end(); ++it) {
            if (!it.value().is_string()) {
                return malformed(where, "attribute '" + it.key() + "' is not a string");
            }
            element.attributes.emplace(it.key(), it.value().get<std::string>());
        }
    }

    auto actions = node.find("m");
    if (actions != node.end() && !actions->is_null()) {
        if (!actions->is_array()) return malformed(where, "'m' is not an array");
        for (const auto& a : *actions) {
            if (!a.is_string()) return malformed(where, "action name is not a string");
            element.actions.push_back(a.get<std::string>());
        }
    }

    auto children = node.find("c");
    if (children != node.end() && !children->is_null()) {
        if (!children->is_array()) return malformed(where, "'c' is not an array");
        element.children.reserve(children->size());
        for (size_t i = 0; i < children->size(); ++i) {
            auto child = decode_element((*children)[i], where + ".c[" + std::to_string(i) + "]");
            if (child.is_err()) return child;
            element.children.push_back(child.take());
        }
    }

    return ElementResult::ok(std::move(element));
}

json encode_element(const common::Element& element) {
    json node = json::object();
    if (element.identifier) node["id"] = *element.identifier;
    node["e"] = element.kind;
    if (element.path) node["p"] = *element.path;
    if (element.depth) node["d"] = *element.depth;
    if (element.frame) {
        const auto& f = *element.frame;
        node["f"] = json::array({f.x, f.y, f.width, f.height});
    }
    if (!element.attributes.empty()) node["a"] = element.attributes;
    if (!element.actions.empty()) node["m"] = element.actions;
    if (!element.children.empty()) {
        json children = json::array();
        for (const auto& child : element.children) {
            children.push_back(encode_element(child));
        }
        node["c"] = std::move(children);
    }
    if (element.owning_application) node["app"] = *element.owning_application;
    if (element.is_focused) node["focused"] = *element.is_focused;
    if (element.is_main) node["main"] = *element.is_main;
    if (element.app_active) node["appActive"] = *element.app_active;
    return node;
}

} // namespace

common::Result<common::Tree> TreeDecoder::decode(const std::string& raw) {
    using TreeResult = common::Result<common::Tree>;

    json doc = json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return TreeResult::err(common::ErrorCode::DecodeError, "payload is not valid JSON");
    }
    if (!doc.is_object()) {
        return TreeResult::err(common::ErrorCode::DecodeError, "payload is not an object");
    }

    auto roots = doc.find("e");
    if (roots == doc.end()) {
        auto marker = doc.find("error");
        if (marker != doc.end()) {
            std::string message = marker->is_string() ? marker->get<std::string>() : marker->dump();
            return TreeResult::err(common::ErrorCode::ProviderCallFailed, message);
        }
        return TreeResult::err(common::ErrorCode::DecodeError, "missing root list 'e'");
    }
    if (!roots->is_array()) {
        return TreeResult::err(common::ErrorCode::DecodeError, "'e' is not an array");
    }

    common::Tree tree;

    auto ts = doc.find("ts");
    if (ts != doc.end() && ts->is_string()) {
        tree.timestamp = ts->get<std::string>();
    }

    tree.roots.reserve(roots->size());
    for (size_t i = 0; i < roots->size(); ++i) {
        auto root = decode_element((*roots)[i], "e[" + std::to_string(i) + "]");
        if (root.is_err()) return TreeResult::err(root.error());
        tree.roots.push_back(root.take());
    }

    return TreeResult::ok(std::move(tree));
}

std::string TreeDecoder::encode(const common::Tree& tree) {
    json doc = json::object();
    if (tree.timestamp) doc["ts"] = *tree.timestamp;
    json roots = json::array();
    for (const auto& root : tree.roots) {
        roots.push_back(encode_element(root));
    }
    doc["e"] = std::move(roots);
    return doc.dump();
}

} // namespace core
