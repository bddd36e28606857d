#include "common/status.h"

#include <cstdarg>
#include <cstdio>
#include <vector>

namespace Common {

const char* errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NONE:                return "OK";
        case ErrorKind::PATH_VIOLATION:      return "PATH_VIOLATION";
        case ErrorKind::MISSING_RESOURCE:    return "MISSING_RESOURCE";
        case ErrorKind::SECURITY_REJECTION:  return "SECURITY_REJECTION";
        case ErrorKind::STRUCTURAL_INVALID:  return "STRUCTURAL_INVALID";
        case ErrorKind::MODULE_LOAD_FAILURE: return "MODULE_LOAD_FAILURE";
        case ErrorKind::TRANSFORM_EXECUTION: return "TRANSFORM_EXECUTION";
        case ErrorKind::CONFIG_INVALID:      return "CONFIG_INVALID";
        case ErrorKind::IO_FAILURE:          return "IO_FAILURE";
        case ErrorKind::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

Status Status::error(ErrorKind kind, const char* format, ...) {
    char small[256];
    va_list args;
    va_start(args, format);
    va_list copy;
    va_copy(copy, args);
    int len = std::vsnprintf(small, sizeof(small), format, args);
    va_end(args);

    std::string message;
    if (len < 0) {
        message = format;
    } else if (static_cast<size_t>(len) < sizeof(small)) {
        message.assign(small, static_cast<size_t>(len));
    } else {
        std::vector<char> big(static_cast<size_t>(len) + 1);
        std::vsnprintf(big.data(), big.size(), format, copy);
        message.assign(big.data(), static_cast<size_t>(len));
    }
    va_end(copy);
    return Status(kind, std::move(message));
}

Status& Status::withContext(const std::string& context) {
    if (!isOk()) {
        message_ = context + ": " + message_;
    }
    return *this;
}

std::string Status::toString() const {
    if (isOk()) {
        return "OK";
    }
    std::string out = "[";
    out += errorKindToString(kind_);
    out += "] ";
    out += message_;
    return out;
}

} // namespace Common
