#pragma once

#include <string>
#include <string_view>

namespace XdgEntry {

// Returns true if bytes is well-formed UTF-8. NUL is a valid code point and is accepted.
bool IsValidUtf8(std::string_view bytes);

// Renders bytes as "[0x.., 0x..]" for diagnostics of non-text input.
std::string FormatByteDump(std::string_view bytes);

// Text as-is if it is valid UTF-8, otherwise FormatByteDump().
std::string TextOrByteDump(std::string_view bytes);

} // namespace XdgEntry
