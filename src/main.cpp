#include "common/Logger.hpp"
#include "core/AccessibilityService.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/Config.hpp"
#include "core/PlatformRegistry.hpp"
#include "handlers/AccessibilityCommandHandler.hpp"
#include "testing/MockAccessibilityProvider.hpp"

// Conditional Includes
#ifdef PLATFORM_MACOS
    #include "platform/macos/MacOSPlatformFactory.hpp"
#elif defined(PLATFORM_LINUX)
    #include "platform/linux/LinuxPlatformFactory.hpp"
#endif

#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>

int main(int argc, char** argv) {
    auto parsed = core::parse_config(argc, argv);
    if (parsed.is_err()) {
        std::cerr << "[Main] " << parsed.error().message << "\n\n" << core::usage(argv[0]);
        return 2;
    }
    core::Config config = parsed.take();
    if (config.show_help) {
        std::cout << core::usage(argv[0]);
        return 0;
    }

    auto logger = std::make_shared<common::ConsoleLogger>(config.log_level);
    logger->info("[Main] Accessibility agent starting...");

    // 1. HAL
    std::shared_ptr<interfaces::IAccessibilityProvider> provider;
    std::shared_ptr<interfaces::IElementScanner> scanner;

    if (config.use_mock_provider) {
        logger->info("[Main] Mode: MOCK PROVIDER");
        provider = std::make_shared<testing::MockAccessibilityProvider>(
            testing::MockAccessibilityProvider::demo_hierarchy());
        auto mock = std::static_pointer_cast<testing::MockAccessibilityProvider>(provider);
        mock->set_type_reply(R"({"before":"","after":"typed"})");
        mock->set_named_reply(R"({"result": "success"})");
        scanner = std::make_shared<testing::MockElementScanner>(std::vector<common::UIElementSummary>{
            {"AXButton", "Done", "", 700, 560},
        });
    } else {
        auto& registry = core::PlatformRegistry::instance();
        registry.set_logger(logger);
#ifdef PLATFORM_MACOS
        registry.register_factory(std::make_unique<platform::macos::MacOSPlatformFactory>(logger));
#elif defined(PLATFORM_LINUX)
        registry.register_factory(std::make_unique<platform::linux_platform::LinuxPlatformFactory>(logger));
#endif
        if (auto* factory = registry.get_current_platform()) {
            provider = factory->create_accessibility_provider();
            scanner = factory->create_element_scanner();
        }
    }

    // 2. Service
    auto service = std::make_shared<core::AccessibilityService>(
        provider, scanner, config.service, logger);

    std::set<std::string> last_labels;
    service->polling().set_tick_listener([logger, &last_labels](const core::TickReport& report) {
        if (!report.decoded || report.labels == last_labels) return;
        last_labels = report.labels;
        logger->debug("[Main] Overlay set changed: " + std::to_string(last_labels.size()) + " active");
    });

    // 3. Commands
    core::command::CommandDispatcher dispatcher(logger);
    dispatcher.register_handler(std::make_shared<handlers::AccessibilityCommandHandler>(service));

    std::mutex out_mutex;
    core::command::CommandContext ctx;
    ctx.respond = [&out_mutex](const std::string& line) {
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << line << std::endl;
    };

    logger->info("[Main] Ready. Reading commands from stdin.");

    std::string line;
    while (std::getline(std::cin, line)) {
        auto result = dispatcher.dispatch(line, ctx);
        if (result.is_err()) {
            logger->debug(std::string("[Main] Command failed: ") +
                          common::to_string(result.error().code) + ": " + result.error().message);
        }
    }

    auto stats = dispatcher.get_stats();
    logger->info("[Main] Input closed after " + std::to_string(stats.total_dispatched) +
                 " commands (" + std::to_string(stats.execution_errors) + " errors)");

    service->stop_accessibility_polling();
    service.reset();
    core::PlatformRegistry::instance().shutdown();
    return 0;
}
