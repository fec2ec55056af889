#pragma once

#include "ParseError.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace XdgEntry {

// Owns the raw bytes of an entry file together with an index over them.
//
// The index never stores pointers into the buffer, only (offset, length) spans, and resolves
// them to views on lookup. Moving or copying the store therefore keeps the index valid; views
// handed out by a lookup stay valid as long as the store that produced them is alive.
// Once built the store is immutable, so concurrent const access needs no locking.
class EntryStore
{
public:

	struct TextSpan
	{
		size_t offset = 0;
		size_t length = 0;
	};

	// Tokenizes 'data' completely, checks that every title, name, parameter key and value is UTF-8,
	// and indexes the result. Any failure aborts the whole build.
	static std::optional<EntryStore> Build(std::string data, ParseError* error = nullptr);

	// Plain value of an attribute, or the value of one of its parameters if 'parameter' is set.
	std::optional<std::string_view> Get(std::string_view section, std::string_view attribute,
		std::optional<std::string_view> parameter = std::nullopt) const;

	bool HasSection(std::string_view section) const;
	// The store's own view of a section title, which lives as long as the store.
	std::optional<std::string_view> FindSectionName(std::string_view section) const;
	bool HasAttribute(std::string_view section, std::string_view attribute) const;
	bool HasParameter(std::string_view section, std::string_view attribute, std::string_view parameter) const;

	// Names are returned in no particular order. Every call produces a fresh list.
	std::vector<std::string_view> SectionNames() const;
	std::optional<std::vector<std::string_view>> AttributeNames(std::string_view section) const;
	std::optional<std::vector<std::string_view>> ParameterKeys(std::string_view section, std::string_view attribute) const;

	size_t SectionCount() const { return _sections.size(); }
	std::string_view Data() const { return _data; }

private:

	struct ParameterSlot
	{
		TextSpan key;
		TextSpan value;
	};

	struct AttributeSlot
	{
		TextSpan name;
		std::optional<TextSpan> value;
		std::optional<std::vector<ParameterSlot>> parameters;
	};

	struct SectionSlot
	{
		TextSpan name;
		std::vector<AttributeSlot> attributes;
	};

	class Builder;

	EntryStore(std::string data, std::vector<SectionSlot> sections)
		: _data(std::move(data)), _sections(std::move(sections)) {}

	std::string_view Resolve(const TextSpan& span) const
	{
		return std::string_view(_data).substr(span.offset, span.length);
	}

	// Tables are kept sorted by resolved name; lookups are binary searches.
	template <typename Slot>
	const Slot* FindSlot(const std::vector<Slot>& slots, TextSpan Slot::* name_member, std::string_view name) const;

	const SectionSlot* FindSection(std::string_view section) const;
	const AttributeSlot* FindAttribute(std::string_view section, std::string_view attribute) const;

	std::string _data;
	std::vector<SectionSlot> _sections;
};

} // namespace XdgEntry
