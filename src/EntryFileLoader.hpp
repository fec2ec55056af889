#pragma once

#include "ParseError.hpp"
#include <optional>
#include <string>

namespace XdgEntry {

// Reads a whole file into memory through GIO. On failure returns nullopt and,
// if 'error' is given, a ParseError of kind FileRead carrying GLib's message.
std::optional<std::string> LoadFileContents(const std::string& path, ParseError* error = nullptr);

} // namespace XdgEntry
