#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "common/macros.h"

namespace Common {

/// Error categories reported across module boundaries
enum class ErrorKind : uint8_t {
    NONE = 0,
    PATH_VIOLATION = 1,       // Blocked or escaping path, always fatal
    MISSING_RESOURCE = 2,     // File or directory absent / wrong type
    SECURITY_REJECTION = 3,   // Module failed the risk gate
    STRUCTURAL_INVALID = 4,   // Module evaluates but exports no transform
    MODULE_LOAD_FAILURE = 5,  // Module source failed to evaluate
    TRANSFORM_EXECUTION = 6,  // A transform raised during application
    CONFIG_INVALID = 7,
    IO_FAILURE = 8,
    INVALID_ARGUMENT = 9
};

[[nodiscard]] const char* errorKindToString(ErrorKind kind) noexcept;

/// Outcome of a fallible operation: ErrorKind::NONE or a kind plus message.
class [[nodiscard]] Status {
public:
    Status() = default;
    Status(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    static Status ok() { return Status(); }

    /// printf-style constructor for error statuses
    static Status error(ErrorKind kind, const char* format, ...) PRINTF_FORMAT(2, 3);

    bool isOk() const noexcept { return kind_ == ErrorKind::NONE; }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    /// Prefixes the message with context, keeping the kind
    Status& withContext(const std::string& context);

    /// "[KIND] message", or "OK"
    std::string toString() const;

private:
    ErrorKind kind_{ErrorKind::NONE};
    std::string message_;
};

} // namespace Common
