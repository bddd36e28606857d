#pragma once

#include <string>

#include "common/path_guard.h"
#include "common/status.h"

namespace Markgate::Dom {

/// Pretty-printing options, read from the --format-config JSON file:
///   { "indent": true, "removeBlanks": true }
struct FormatOptions {
    bool indent{true};          // Break lines around block elements
    bool remove_blanks{true};   // Drop whitespace-only text before re-indenting
};

/// Re-serializes finished HTML in a stable layout. Formatting is cosmetic:
/// any failure keeps the unformatted markup.
class Formatter {
public:
    explicit Formatter(FormatOptions options = FormatOptions()) noexcept : options_(options) {}

    /// Reads options from a JSON file. A missing or malformed file is
    /// reported and leaves the defaults in place.
    static Common::Status loadOptions(const std::string& path, FormatOptions& out);

    /// loadOptions() once guard accepts path as a readable file
    static Common::Status loadOptions(const Common::PathGuard& guard, const std::string& path,
                                      FormatOptions& out);

    [[nodiscard]] std::string format(const std::string& html) const;

    [[nodiscard]] const FormatOptions& options() const noexcept { return options_; }

private:
    FormatOptions options_;
};

} // namespace Markgate::Dom
