#include "core/Config.hpp"
#include <sstream>
#include <stdexcept>

namespace core {

namespace {

using ConfigResult = common::Result<Config>;

ConfigResult invalid(const std::string& msg) {
    return ConfigResult::err(common::ErrorCode::InvalidArgument, msg);
}

// Positive integer or nothing
bool parse_positive(const std::string& text, long& out) {
    try {
        size_t used = 0;
        long value = std::stol(text, &used);
        if (used != text.size() || value <= 0) return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_level(const std::string& text, common::LogLevel& out) {
    if (text == "debug") out = common::LogLevel::Debug;
    else if (text == "info") out = common::LogLevel::Info;
    else if (text == "warn") out = common::LogLevel::Warn;
    else if (text == "error") out = common::LogLevel::Error;
    else return false;
    return true;
}

} // namespace

common::Result<Config> parse_config(int argc, const char* const* argv) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key = arg;
        std::string value;

        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            key = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        if (key == "--help" || key == "-h") {
            config.show_help = true;
        } else if (key == "--mock") {
            config.use_mock_provider = true;
        } else if (key == "--interval-ms") {
            long ms = 0;
            if (!parse_positive(value, ms)) return invalid("--interval-ms expects a positive integer");
            config.service.polling.interval = std::chrono::milliseconds(ms);
        } else if (key == "--workers") {
            long n = 0;
            if (!parse_positive(value, n)) return invalid("--workers expects a positive integer");
            config.service.native_workers = static_cast<size_t>(n);
        } else if (key == "--self-app") {
            if (value.empty()) return invalid("--self-app expects a non-empty name");
            config.service.polling.self_app_name = value;
        } else if (key == "--log-level") {
            if (!parse_level(value, config.log_level)) {
                return invalid("--log-level expects debug|info|warn|error");
            }
        } else {
            return invalid("unknown option: " + arg);
        }
    }

    return ConfigResult::ok(config);
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --interval-ms=N     polling delay between ticks (default 200)\n"
        << "  --self-app=NAME     hosting application name to ignore (default alvea)\n"
        << "  --workers=N         native call workers (default 2)\n"
        << "  --log-level=LEVEL   debug|info|warn|error (default info)\n"
        << "  --mock              use the built-in mock provider\n"
        << "  --help              show this message\n"
        << "Commands are read from stdin, one per line.\n";
    return out.str();
}

} // namespace core
