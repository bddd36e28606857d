#pragma once

#include <string>

#include "common/status.h"

namespace Common {

/// Reads a whole file. IO_FAILURE on open or read errors.
Status readTextFile(const std::string& path, std::string& out);

/// Truncates and writes path. IO_FAILURE on open or short write.
Status writeTextFile(const std::string& path, const std::string& content);

/// mkdir -p. Fails if a path component exists and is not a directory.
Status createDirectories(const std::string& path);

} // namespace Common
