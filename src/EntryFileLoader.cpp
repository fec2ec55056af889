#include "EntryFileLoader.hpp"
#include <gio/gio.h>
#include <memory>

namespace XdgEntry {

// Smart pointers for GLib/GIO types so that every exit path releases them.
using GFilePtr = std::unique_ptr<GFile, decltype(&g_object_unref)>;
using GErrorPtr = std::unique_ptr<GError, decltype(&g_error_free)>;
using GCharPtr = std::unique_ptr<char, decltype(&g_free)>;


std::optional<std::string> LoadFileContents(const std::string& path, ParseError* error)
{
	GFilePtr file(g_file_new_for_path(path.c_str()), g_object_unref);

	char* raw_contents = nullptr;
	gsize length = 0;
	GError* raw_error = nullptr;
	if (!g_file_load_contents(file.get(), nullptr, &raw_contents, &length, nullptr, &raw_error)) {
		GErrorPtr gerror(raw_error, g_error_free);
		std::string message = gerror ? gerror->message : "unknown error";
		g_debug("Cannot load '%s': %s", path.c_str(), message.c_str());
		if (error) {
			*error = ParseError::FileRead(path, std::move(message));
		}
		return std::nullopt;
	}

	GCharPtr contents(raw_contents, g_free);
	return std::string(contents.get(), length);
}

} // namespace XdgEntry
