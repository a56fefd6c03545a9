#include "core/ActionDispatcher.hpp"
#include "core/NativeString.hpp"

namespace core {

namespace {
constexpr const char* kUnavailable = "This feature is only available on macOS";
constexpr const char* kSuccessMarker = "success";
}

ActionDispatcher::ActionDispatcher(
    std::shared_ptr<interfaces::IAccessibilityProvider> provider,
    std::shared_ptr<common::ILogger> logger
) : provider_(std::move(provider)), logger_(std::move(logger)) {}

common::Result<std::string> ActionDispatcher::type_text(
    const std::string& element_id,
    const std::string& text
) {
    using TextResult = common::Result<std::string>;

    if (!provider_) {
        return TextResult::err(common::ErrorCode::ProviderUnavailable, kUnavailable);
    }
    if (has_embedded_nul(element_id) || has_embedded_nul(text)) {
        return TextResult::err(common::ErrorCode::InvalidArgument,
                               "element id or text contains a NUL byte", AXWATCH_LOCATION);
    }

    logger_->info("[ActionDispatcher] Typing into element " + element_id +
                  " (" + std::to_string(text.size()) + " bytes)");

    NativeString reply(*provider_, provider_->perform_type_action(element_id.c_str(), text.c_str()));
    if (reply.is_null()) {
        return TextResult::err(common::ErrorCode::ActionFailed, "Failed to perform typing action");
    }
    return TextResult::ok(reply.str());
}

common::EmptyResult ActionDispatcher::invoke_named_action(
    const std::string& element_id,
    const std::string& action_name
) {
    if (!provider_) {
        return common::EmptyResult::err(common::ErrorCode::ProviderUnavailable, kUnavailable);
    }
    if (has_embedded_nul(element_id) || has_embedded_nul(action_name)) {
        return common::EmptyResult::err(common::ErrorCode::InvalidArgument,
                                        "element id or action name contains a NUL byte",
                                        AXWATCH_LOCATION);
    }

    logger_->info("[ActionDispatcher] Performing " + action_name + " on element " + element_id);

    NativeString reply(*provider_,
                       provider_->perform_named_action(element_id.c_str(), action_name.c_str()));
    if (reply.is_null()) {
        return common::EmptyResult::err(common::ErrorCode::ActionFailed,
                                        "Failed to perform named action");
    }

    auto result = interpret_action_reply(reply.str());
    if (result.is_err()) {
        logger_->warn("[ActionDispatcher] Action rejected: " + result.error().message);
    }
    return result;
}

// TODO: switch to parsing {"result": "success"} once the provider's error
// replies are JSON as well; today they are plain "Error: ..." text.
common::EmptyResult ActionDispatcher::interpret_action_reply(const std::string& reply) {
    if (reply.find(kSuccessMarker) != std::string::npos) {
        return common::EmptyResult::success();
    }
    return common::EmptyResult::err(common::ErrorCode::ActionRejected, reply);
}

} // namespace core
