#pragma once
#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace common {

    struct Ok {};

    enum class ErrorCode {
        Success = 0,
        ProviderUnavailable, // Platform has no accessibility provider
        ProviderCallFailed,  // Native call returned null or an error marker
        DecodeError,         // Malformed or partial snapshot payload
        ActionFailed,        // Native action call returned null
        ActionRejected,      // Native action ran but did not report success
        InvalidArgument,
        Unknown
    };

    inline const char* to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::Success:             return "Success";
            case ErrorCode::ProviderUnavailable: return "ProviderUnavailable";
            case ErrorCode::ProviderCallFailed:  return "ProviderCallFailed";
            case ErrorCode::DecodeError:         return "DecodeError";
            case ErrorCode::ActionFailed:        return "ActionFailed";
            case ErrorCode::ActionRejected:      return "ActionRejected";
            case ErrorCode::InvalidArgument:     return "InvalidArgument";
            case ErrorCode::Unknown:             return "Unknown";
        }
        return "Unknown";
    }

    struct AppError {
        ErrorCode code;
        std::string message;
        std::string location; // __FILE__:__LINE__
    };

    template <typename T = Ok>
    class Result {
        std::variant<T, AppError> value;

    public:
        Result(T v) : value(std::move(v)) {}
        Result(AppError e) : value(std::move(e)) {}

        static Result<T> ok(T v) { return Result(std::move(v)); }

        static Result<T> err(ErrorCode code, const std::string& msg, const std::string& loc = "") {
            return Result(AppError{code, msg, loc});
        }

        // Forwards an error produced by a call with a different value type
        static Result<T> err(const AppError& e) { return Result(e); }

        bool is_ok() const { return std::holds_alternative<T>(value); }
        bool is_err() const { return std::holds_alternative<AppError>(value); }
        explicit operator bool() const { return is_ok(); }

        const T& unwrap() const {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::unwrap failed: " + e.message);
            }
            return std::get<T>(value);
        }

        // Moves the value out; the Result is left holding a moved-from T
        T take() {
            if (is_err()) {
                const auto& e = std::get<AppError>(value);
                throw std::runtime_error("Result::take failed: " + e.message);
            }
            return std::move(std::get<T>(value));
        }

        const AppError& error() const {
            if (is_ok()) {
                throw std::logic_error("Result::error called on success value");
            }
            return std::get<AppError>(value);
        }

        static Result<Ok> success() { return Result<Ok>(Ok{}); }
    };

    using EmptyResult = Result<Ok>;

} // namespace common

#define AXWATCH_STR_(x) #x
#define AXWATCH_STR(x) AXWATCH_STR_(x)
#define AXWATCH_LOCATION (std::string(__FILE__) + ":" AXWATCH_STR(__LINE__))
