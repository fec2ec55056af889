#include "Entry.hpp"
#include "EntryFileLoader.hpp"
#include "EntryTokenizer.hpp"
#include "DebugFormat.hpp"
#include <glib.h>
#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// xdgentry-query: prints values from a desktop entry, icon theme index or systemd unit.
//
//	xdgentry-query --section Service --attr ExecStart /usr/lib/systemd/system/sshd.service
//	xdgentry-query --section "Desktop Entry" --attr Name --param de firefox.desktop
//	xdgentry-query --list firefox.desktop

namespace {

using GCharPtr = std::unique_ptr<gchar, decltype(&g_free)>;
using GStrvPtr = std::unique_ptr<gchar*, decltype(&g_strfreev)>;
using GOptionContextPtr = std::unique_ptr<GOptionContext, decltype(&g_option_context_free)>;
using GErrorPtr = std::unique_ptr<GError, decltype(&g_error_free)>;

// Raw targets for the GOptionEntry table; GLib allocates the strings.
struct QueryOptions
{
	gchar* section = nullptr;
	gchar* attr = nullptr;
	gchar* param = nullptr;
	gboolean list = FALSE;
	gboolean dump = FALSE;
	gboolean debug = FALSE;
	gchar** files = nullptr;
};


void PrintSorted(std::vector<std::string_view> names)
{
	std::sort(names.begin(), names.end());
	for (auto name : names) {
		std::cout << name << '\n';
	}
}


// Tokenizes the file again and prints every section record as the tokenizer sees it.
int DumpSections(const std::string& path)
{
	XdgEntry::ParseError error;
	auto contents = XdgEntry::LoadFileContents(path, &error);
	if (!contents) {
		g_printerr("%s\n", error.Describe().c_str());
		return 1;
	}

	XdgEntry::EntryTokenizer tokenizer(*contents);
	XdgEntry::SectionRecord section;
	while (tokenizer.Next(section, &error)) {
		std::cout << section << '\n';
	}
	if (tokenizer.Failed()) {
		g_printerr("%s\n", error.Describe().c_str());
		return 1;
	}
	return 0;
}


int RunQuery(const QueryOptions& options, const std::string& path)
{
	XdgEntry::ParseError error;
	auto entry = XdgEntry::Entry::ParseFile(path, &error);
	if (!entry) {
		g_printerr("%s\n", error.Describe().c_str());
		return 1;
	}

	if (options.list) {
		if (!options.section) {
			PrintSorted(entry->Store().SectionNames());
			return 0;
		}
		auto names = entry->Section(options.section).AttrNames();
		if (!names) {
			g_printerr("No section [%s]\n", options.section);
			return 1;
		}
		PrintSorted(std::move(*names));
		return 0;
	}

	if (!options.section || !options.attr) {
		g_printerr("Both --section and --attr are required unless --list or --dump is given\n");
		return 2;
	}

	auto selector = entry->Section(options.section);
	auto value = options.param ? selector.AttrWithParam(options.attr, options.param) : selector.Attr(options.attr);
	if (!value) {
		g_printerr("Attribute doesn't exist\n");
		return 1;
	}
	std::cout << *value << '\n';
	return 0;
}

} // namespace


int main(int argc, char** argv)
{
	QueryOptions options;

	const GOptionEntry option_entries[] = {
		{ "section", 's', 0, G_OPTION_ARG_STRING, &options.section, "Section title", "TITLE" },
		{ "attr", 'a', 0, G_OPTION_ARG_STRING, &options.attr, "Attribute name", "NAME" },
		{ "param", 'p', 0, G_OPTION_ARG_STRING, &options.param, "Attribute parameter, e.g. a locale", "KEY" },
		{ "list", 'l', 0, G_OPTION_ARG_NONE, &options.list, "List sections, or the attributes of --section", nullptr },
		{ "dump", 0, 0, G_OPTION_ARG_NONE, &options.dump, "Print every section as tokenized", nullptr },
		{ "debug", 'd', 0, G_OPTION_ARG_NONE, &options.debug, "Enable debug messages", nullptr },
		{ G_OPTION_REMAINING, 0, 0, G_OPTION_ARG_FILENAME_ARRAY, &options.files, nullptr, "FILE" },
		{ nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr }
	};

	GOptionContextPtr context(g_option_context_new("- query FreeDesktop entry files"), g_option_context_free);
	g_option_context_add_main_entries(context.get(), option_entries, nullptr);

	GError* raw_error = nullptr;
	if (!g_option_context_parse(context.get(), &argc, &argv, &raw_error)) {
		GErrorPtr error(raw_error, g_error_free);
		g_printerr("%s\n", error->message);
		return 2;
	}

	GCharPtr section(options.section, g_free);
	GCharPtr attr(options.attr, g_free);
	GCharPtr param(options.param, g_free);
	GStrvPtr files(options.files, g_strfreev);

	if (!files || !files.get()[0] || files.get()[1]) {
		g_printerr("Exactly one FILE is expected\n");
		return 2;
	}

	if (options.debug) {
		g_log_set_debug_enabled(TRUE);
	}

	const std::string path = files.get()[0];
	if (options.dump) {
		return DumpSections(path);
	}
	return RunQuery(options, path);
}
