#include "Utf8.hpp"
#include <glib.h>
#include <cstdio>

namespace XdgEntry {

bool IsValidUtf8(std::string_view bytes)
{
	// g_utf8_validate() stops at NUL even with an explicit length, so validate the runs between them.
	while (!bytes.empty()) {
		auto nul_pos = bytes.find('\0');
		std::string_view run = bytes.substr(0, nul_pos);
		if (!run.empty() && !g_utf8_validate(run.data(), static_cast<gssize>(run.size()), nullptr)) {
			return false;
		}
		if (nul_pos == std::string_view::npos) {
			break;
		}
		bytes.remove_prefix(nul_pos + 1);
	}
	return true;
}


std::string FormatByteDump(std::string_view bytes)
{
	std::string out;
	out.reserve(bytes.size() * 6 + 2);
	out.push_back('[');
	for (size_t i = 0; i < bytes.size(); ++i) {
		if (i != 0) {
			out.append(", ");
		}
		char hex[8];
		std::snprintf(hex, sizeof(hex), "0x%02x", static_cast<unsigned char>(bytes[i]));
		out.append(hex);
	}
	out.push_back(']');
	return out;
}


std::string TextOrByteDump(std::string_view bytes)
{
	if (IsValidUtf8(bytes)) {
		return std::string(bytes);
	}
	return FormatByteDump(bytes);
}

} // namespace XdgEntry
