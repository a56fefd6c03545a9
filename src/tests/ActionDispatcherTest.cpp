// ============================================================================
// ActionDispatcher Test Program
// ============================================================================
// Reply interpretation for named actions, typing replies, missing
// provider, and buffer release on every path.
//
// Run with: ./ActionDispatcherTest
// ============================================================================

#include <memory>
#include <string>

#include "core/ActionDispatcher.hpp"
#include "testing/MockAccessibilityProvider.hpp"
#include "testing/TestHarness.hpp"

using core::ActionDispatcher;
using testing::MockAccessibilityProvider;
using testing::log_test;

namespace {

struct Fixture {
    std::shared_ptr<MockAccessibilityProvider> provider = std::make_shared<MockAccessibilityProvider>();
    ActionDispatcher actions{provider, std::make_shared<common::NullLogger>()};
};

std::string describe(const common::EmptyResult& r) {
    if (r.is_ok()) return "ok";
    return std::string(common::to_string(r.error().code)) + ": " + r.error().message;
}

} // namespace

// ============================================================================
// Test: interpret_action_reply
// ============================================================================

void test_interpret_reply() {
    testing::section("Testing interpret_action_reply");

    log_test("reply(\"action success\")",
             ActionDispatcher::interpret_action_reply("action success").is_ok());
    log_test("reply({\"result\": \"success\"})",
             ActionDispatcher::interpret_action_reply(R"({"result": "success"})").is_ok());

    auto rejected = ActionDispatcher::interpret_action_reply("action failed: not supported");
    bool ok = rejected.is_err() &&
              rejected.error().code == common::ErrorCode::ActionRejected &&
              rejected.error().message == "action failed: not supported";
    log_test("reply(\"action failed: not supported\")", ok, describe(rejected));

    log_test("reply(empty)", ActionDispatcher::interpret_action_reply("").is_err());
    log_test("reply(case-sensitive)", ActionDispatcher::interpret_action_reply("SUCCESS").is_err());
}

// ============================================================================
// Test: invoke_named_action
// ============================================================================

void test_named_action() {
    testing::section("Testing invoke_named_action");

    {
        Fixture f;
        f.provider->set_named_reply(std::string("action success"));
        auto r = f.actions.invoke_named_action("1a2b", "AXPress");
        auto calls = f.provider->named_calls();
        bool ok = r.is_ok() && calls.size() == 1 &&
                  calls[0].element_id == "1a2b" && calls[0].argument == "AXPress";
        log_test("invoke_named_action(success)", ok, describe(r));
        log_test("invoke_named_action(success) releases reply", f.provider->all_released());
    }

    {
        Fixture f;
        f.provider->set_named_reply(std::string("action failed: not supported"));
        auto r = f.actions.invoke_named_action("1a2b", "AXRaise");
        bool ok = r.is_err() && r.error().code == common::ErrorCode::ActionRejected &&
                  r.error().message == "action failed: not supported";
        log_test("invoke_named_action(rejected)", ok, describe(r));
        log_test("invoke_named_action(rejected) releases reply",
                 f.provider->allocated() == 1 && f.provider->all_released());
    }

    {
        Fixture f;
        f.provider->set_named_reply(std::nullopt);
        auto r = f.actions.invoke_named_action("1a2b", "AXPress");
        bool ok = r.is_err() && r.error().code == common::ErrorCode::ActionFailed &&
                  r.error().message == "Failed to perform named action";
        log_test("invoke_named_action(native null)", ok, describe(r));
    }

    {
        Fixture f;
        auto r = f.actions.invoke_named_action(std::string("1a\0b", 4), "AXPress");
        bool ok = r.is_err() && r.error().code == common::ErrorCode::InvalidArgument &&
                  f.provider->named_calls().empty();
        log_test("invoke_named_action(NUL in id)", ok, describe(r));
    }
}

// ============================================================================
// Test: type_text
// ============================================================================

void test_type_text() {
    testing::section("Testing type_text");

    {
        Fixture f;
        const std::string reply = R"({"before":"","after":"hello"})";
        f.provider->set_type_reply(reply);
        auto r = f.actions.type_text("t1", "hello");
        auto calls = f.provider->type_calls();
        bool ok = r.is_ok() && r.unwrap() == reply &&
                  calls.size() == 1 && calls[0].argument == "hello";
        log_test("type_text(reply passed through)", ok);
        log_test("type_text releases reply", f.provider->allocated() == 1 && f.provider->all_released());
    }

    {
        Fixture f;
        f.provider->set_type_reply(std::string("Error: element not found"));
        auto r = f.actions.type_text("t1", "hello");
        log_test("type_text(error text is not interpreted)",
                 r.is_ok() && r.unwrap() == "Error: element not found");
    }

    {
        Fixture f;
        f.provider->set_type_reply(std::nullopt);
        auto r = f.actions.type_text("t1", "hello");
        bool ok = r.is_err() && r.error().code == common::ErrorCode::ActionFailed &&
                  r.error().message == "Failed to perform typing action";
        log_test("type_text(native null)", ok);
    }

    {
        Fixture f;
        auto r = f.actions.type_text("t1", std::string("a\0b", 3));
        log_test("type_text(NUL in text)",
                 r.is_err() && r.error().code == common::ErrorCode::InvalidArgument &&
                 f.provider->type_calls().empty());
    }
}

// ============================================================================
// Test: no provider
// ============================================================================

void test_unavailable() {
    testing::section("Testing missing provider");

    ActionDispatcher actions(nullptr, std::make_shared<common::NullLogger>());

    auto typed = actions.type_text("t1", "hello");
    log_test("type_text(no provider)",
             typed.is_err() && typed.error().code == common::ErrorCode::ProviderUnavailable);

    auto named = actions.invoke_named_action("b1", "AXPress");
    log_test("invoke_named_action(no provider)",
             named.is_err() && named.error().code == common::ErrorCode::ProviderUnavailable,
             describe(named));
}

int main() {
    std::cout << "ActionDispatcher Test Suite" << std::endl;
    std::cout << "===========================" << std::endl;

    test_interpret_reply();
    test_named_action();
    test_type_text();
    test_unavailable();

    return testing::print_summary();
}
