// ============================================================================
// Command Layer Test Program
// ============================================================================
// Line parsing, routing through CommandDispatcher to the accessibility
// handler, response lines and argument validation.
//
// Run with: ./CommandHandlerTest
// ============================================================================

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/AccessibilityService.hpp"
#include "core/CommandDispatcher.hpp"
#include "handlers/AccessibilityCommandHandler.hpp"
#include "testing/MockAccessibilityProvider.hpp"
#include "testing/TestHarness.hpp"

using core::command::CommandDispatcher;
using testing::MockAccessibilityProvider;
using testing::log_test;
using json = nlohmann::json;

namespace {

struct Fixture {
    explicit Fixture(bool with_provider = true) {
        auto logger = std::make_shared<common::NullLogger>();
        std::shared_ptr<interfaces::IElementScanner> scanner;
        if (with_provider) {
            provider = std::make_shared<MockAccessibilityProvider>(MockAccessibilityProvider::demo_hierarchy());
            scanner = std::make_shared<testing::MockElementScanner>(std::vector<common::UIElementSummary>{
                {"AXButton", "Done", "", 700, 560},
                {"AXCheckBox", "Bold", "1", 12.5, 40},
            });
        }
        service = std::make_shared<core::AccessibilityService>(
            provider, scanner, core::ServiceOptions{}, logger);
        dispatcher = std::make_unique<CommandDispatcher>(logger);
        dispatcher->register_handler(std::make_shared<handlers::AccessibilityCommandHandler>(service));
        ctx.respond = [this](const std::string& line) { responses.push_back(line); };
    }

    common::EmptyResult send(const std::string& line) {
        responses.clear();
        return dispatcher->dispatch(line, ctx);
    }

    std::string last() const { return responses.empty() ? "" : responses.back(); }

    std::shared_ptr<MockAccessibilityProvider> provider;
    std::shared_ptr<core::AccessibilityService> service;
    std::unique_ptr<CommandDispatcher> dispatcher;
    core::command::CommandContext ctx;
    std::vector<std::string> responses;
};

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

// ============================================================================
// Test: parse_message
// ============================================================================

void test_parse_message() {
    testing::section("Testing parse_message");

    auto [name, args] = CommandDispatcher::parse_message("perform_named_action {\"a\": 1}\r\n");
    log_test("parse_message(name + args, CRLF)", name == "perform_named_action" && args == "{\"a\": 1}", args);

    auto [bare, none] = CommandDispatcher::parse_message("   fetch_ui_elements");
    log_test("parse_message(leading spaces)", bare == "fetch_ui_elements" && none.empty());

    auto [empty, rest] = CommandDispatcher::parse_message("   ");
    log_test("parse_message(blank)", empty.empty() && rest.empty());
}

// ============================================================================
// Test: routing and responses
// ============================================================================

void test_queries() {
    testing::section("Testing query commands");

    {
        Fixture f;
        auto r = f.send("fetch_ui_elements");
        bool ok = r.is_ok() && starts_with(f.last(), "DATA:UI_ELEMENTS:");
        if (ok) {
            json list = json::parse(f.last().substr(std::string("DATA:UI_ELEMENTS:").size()));
            ok = list.size() == 2 && list[0]["role"] == "AXButton" && list[1]["x"] == 12.5;
        }
        log_test("fetch_ui_elements", ok, f.last());
    }

    {
        Fixture f;
        f.send(R"(get_accessibility_snapshot {"app": "Notes"})");
        auto calls = f.provider->filtered_calls();
        bool ok = f.last() == "DATA:SNAPSHOT:" + MockAccessibilityProvider::demo_hierarchy() &&
                  calls.size() == 1 && calls[0].app == std::optional<std::string>("Notes");
        log_test("get_accessibility_snapshot(app filter)", ok);
    }

    {
        Fixture f;
        f.send("get_accessibility_snapshot");
        log_test("get_accessibility_snapshot(no args)", f.provider->unfiltered_calls() == 1);
    }

    {
        Fixture f;
        auto r = f.send("get_accessibility_snapshot [1,2]");
        log_test("get_accessibility_snapshot(bad args)",
                 r.is_err() && starts_with(f.last(), "ERROR:SNAPSHOT:"), f.last());
    }

    {
        Fixture f;
        f.send("get_overlay_candidates");
        bool empty_ok = f.last() == "DATA:OVERLAYS:[]";

        f.service->polling().run_tick();
        f.send("get_overlay_candidates");
        json list = json::parse(f.last().substr(std::string("DATA:OVERLAYS:").size()));
        bool ok = empty_ok && list.size() == 1 &&
                  list[0]["label"] == "overlay_0_selection" &&
                  list[0]["bounds"] == json::array({120.0, 80.0, 64.0, 18.0});
        log_test("get_overlay_candidates", ok, f.last());

        f.send("get_selection_context");
        log_test("get_selection_context", f.last() == "DATA:CONTEXT:Notes", f.last());
    }
}

void test_actions() {
    testing::section("Testing action commands");

    {
        Fixture f;
        f.provider->set_named_reply(std::string(R"({"result": "success"})"));
        auto r = f.send(R"(perform_named_action {"element_id": "b1", "action": "AXPress"})");
        log_test("perform_named_action(ok)", r.is_ok() && f.last() == "STATUS:ACTION:ok", f.last());
    }

    {
        Fixture f;
        f.provider->set_named_reply(std::string("Error: action not supported"));
        auto r = f.send(R"(perform_named_action {"element_id": "b1", "action": "AXRaise"})");
        bool ok = r.is_err() && r.error().code == common::ErrorCode::ActionRejected &&
                  f.last() == "ERROR:ACTION:Error: action not supported";
        log_test("perform_named_action(rejected)", ok, f.last());
    }

    {
        Fixture f;
        auto r = f.send(R"(perform_named_action {"element_id": "b1"})");
        bool ok = r.is_err() && starts_with(f.last(), "ERROR:ACTION:") && f.provider->named_calls().empty();
        log_test("perform_named_action(missing action)", ok, f.last());
    }

    {
        Fixture f;
        f.provider->set_type_reply(std::string(R"({"before":"","after":"hi"})"));
        auto r = f.send(R"(perform_typing_action {"element_id": "t1", "text": "hi"})");
        bool ok = r.is_ok() && f.last() == R"(DATA:TYPING:{"before":"","after":"hi"})";
        log_test("perform_typing_action(ok)", ok, f.last());
    }

    {
        Fixture f;
        auto r = f.send("perform_typing_action not-json");
        log_test("perform_typing_action(bad args)", r.is_err() && starts_with(f.last(), "ERROR:TYPING:"));
    }

    {
        Fixture f(false);
        auto r = f.send(R"(perform_typing_action {"element_id": "t1", "text": "hi"})");
        bool ok = r.is_err() && r.error().code == common::ErrorCode::ProviderUnavailable &&
                  f.last() == "ERROR:TYPING:This feature is only available on macOS";
        log_test("perform_typing_action(no provider)", ok, f.last());

        f.send("get_accessibility_snapshot");
        log_test("get_accessibility_snapshot(no provider)",
                 f.last() == R"(DATA:SNAPSHOT:{"error":"This feature is only available on macOS"})", f.last());

        f.send("fetch_ui_elements");
        log_test("fetch_ui_elements(no scanner)", f.last() == "DATA:UI_ELEMENTS:[]", f.last());
    }
}

void test_polling_and_unknown() {
    testing::section("Testing polling commands and routing");

    {
        Fixture f;
        f.send("start_accessibility_polling");
        bool started = f.last() == "STATUS:POLLING:started" && f.service->polling().is_active();
        f.send("stop_accessibility_polling");
        bool stopped = f.last() == "STATUS:POLLING:stopped" && !f.service->polling().is_active();
        log_test("start/stop_accessibility_polling", started && stopped);
    }

    {
        Fixture f;
        auto r = f.send("reboot_everything now");
        auto stats = f.dispatcher->get_stats();
        log_test("unknown command ignored",
                 r.is_ok() && f.responses.empty() && stats.unknown_commands == 1);
    }

    {
        Fixture f;
        auto r = f.send("");
        log_test("empty line ignored", r.is_ok() && f.dispatcher->get_stats().total_dispatched == 0);
    }
}

int main() {
    std::cout << "Command Layer Test Suite" << std::endl;
    std::cout << "========================" << std::endl;

    test_parse_message();
    test_queries();
    test_actions();
    test_polling_and_unknown();

    return testing::print_summary();
}
