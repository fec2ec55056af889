#pragma once

#include "EntryStore.hpp"
#include "ParseError.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace XdgEntry {

class Entry;

// A view of one section of an Entry, addressed by name.
// The selector refers to the Entry it came from and must not outlive it, nor survive a move of it.
class SectionSelector
{
public:

	std::string_view Name() const { return _exists ? _name : std::string_view(_missing_name); }
	bool Exists() const { return _exists; }

	std::optional<std::string_view> Attr(std::string_view name) const;
	std::optional<std::string_view> AttrWithParam(std::string_view name, std::string_view param) const;
	bool HasAttr(std::string_view name) const;

	std::optional<std::vector<std::string_view>> AttrNames() const;
	std::optional<std::vector<std::string_view>> ParamKeys(std::string_view name) const;

private:
	friend class Entry;

	SectionSelector(const EntryStore& store, std::string_view name);

	const EntryStore* _store;
	bool _exists = false;
	std::string_view _name;     // points into the store when the section exists
	std::string _missing_name;  // the requested name otherwise
};


// A parsed entry file: desktop entry, icon theme index, systemd unit, ...
//
//	auto entry = Entry::ParseFile("/usr/lib/systemd/system/sshd.service");
//	if (entry) {
//		auto start_cmd = entry->Section("Service").Attr("ExecStart");
//	}
class Entry
{
public:

	static std::optional<Entry> Parse(std::string data, ParseError* error = nullptr);

	// Reads the whole file, then parses it. Read failures are reported as ParseError::Kind::FileRead.
	static std::optional<Entry> ParseFile(const std::string& path, ParseError* error = nullptr);

	bool HasSection(std::string_view name) const { return _store.HasSection(name); }

	SectionSelector Section(std::string_view name) const { return SectionSelector(_store, name); }

	// One selector per section, in no particular order.
	std::vector<SectionSelector> Sections() const;

	const EntryStore& Store() const { return _store; }

private:
	explicit Entry(EntryStore store) : _store(std::move(store)) {}

	EntryStore _store;
};

} // namespace XdgEntry
