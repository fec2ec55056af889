#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace XdgEntry {

// All records below are non-owning views into the buffer handed to the tokenizer.


// The bracketed suffix of an attribute name, e.g. "GenericName[es]".
struct AttributeParameter
{
	std::string_view base_name;  // "GenericName"
	std::string_view key;        // "es"

	bool operator==(const AttributeParameter& other) const
	{
		return base_name == other.base_name && key == other.key;
	}
	bool operator!=(const AttributeParameter& other) const { return !(*this == other); }
};


// One "name=value" line of a section.
struct AttributeRecord
{
	std::string_view name;   // raw key, may still carry the "[param]" suffix
	std::string_view value;  // everything after '=' up to the end of line, not trimmed
	std::optional<AttributeParameter> parameter;

	bool operator==(const AttributeRecord& other) const
	{
		return name == other.name && value == other.value && parameter == other.parameter;
	}
	bool operator!=(const AttributeRecord& other) const { return !(*this == other); }
};


// A "[Title]" header together with the attributes that follow it.
struct SectionRecord
{
	std::string_view title;
	std::vector<AttributeRecord> attributes;

	bool operator==(const SectionRecord& other) const
	{
		return title == other.title && attributes == other.attributes;
	}
	bool operator!=(const SectionRecord& other) const { return !(*this == other); }
};

} // namespace XdgEntry
