#include "EntryStore.hpp"
#include "EntryTokenizer.hpp"
#include "Utf8.hpp"
#include <glib.h>
#include <algorithm>
#include <unordered_map>
#include <utility>

namespace XdgEntry {

// ****************************** Builder ******************************

// Accumulates the index as views into the buffer while it still sits in Build()'s frame,
// then converts everything to spans so the buffer can be moved into the store.
class EntryStore::Builder
{
public:
	explicit Builder(std::string_view data) : _data(data) {}

	bool AddSection(const SectionRecord& section_record, ParseError* error);
	std::vector<SectionSlot> Finish() const;

private:
	struct AttributeValue
	{
		std::optional<std::string_view> value;
		std::optional<std::unordered_map<std::string_view, std::string_view>> parameters;
	};

	using AttributeMap = std::unordered_map<std::string_view, AttributeValue>;

	bool CheckText(std::string_view text, ParseError* error) const;
	TextSpan SpanOf(std::string_view view) const;

	template <typename Slot>
	void SortByName(std::vector<Slot>& slots, TextSpan Slot::* name_member) const;

	std::string_view _data;
	std::unordered_map<std::string_view, AttributeMap> _sections;
};


bool EntryStore::Builder::CheckText(std::string_view text, ParseError* error) const
{
	if (IsValidUtf8(text)) {
		return true;
	}
	if (error) {
		*error = ParseError::InvalidUtf8(text);
	}
	return false;
}


bool EntryStore::Builder::AddSection(const SectionRecord& section_record, ParseError* error)
{
	if (!CheckText(section_record.title, error)) {
		return false;
	}

	AttributeMap attributes;
	for (const auto& attribute_record : section_record.attributes) {
		if (!CheckText(attribute_record.value, error)) {
			return false;
		}

		if (attribute_record.parameter) {
			const auto& parameter = *attribute_record.parameter;
			if (!CheckText(parameter.base_name, error) || !CheckText(parameter.key, error)) {
				return false;
			}
			auto& attribute = attributes[parameter.base_name];
			if (!attribute.parameters) {
				attribute.parameters.emplace();
			}
			(*attribute.parameters)[parameter.key] = attribute_record.value;
		} else {
			if (!CheckText(attribute_record.name, error)) {
				return false;
			}
			attributes[attribute_record.name].value = attribute_record.value;
		}
	}

	// A repeated section title replaces the earlier section.
	_sections[section_record.title] = std::move(attributes);
	return true;
}


EntryStore::TextSpan EntryStore::Builder::SpanOf(std::string_view view) const
{
	TextSpan span;
	span.offset = static_cast<size_t>(view.data() - _data.data());
	span.length = view.size();
	return span;
}


template <typename Slot>
void EntryStore::Builder::SortByName(std::vector<Slot>& slots, TextSpan Slot::* name_member) const
{
	std::sort(slots.begin(), slots.end(), [this, name_member](const Slot& a, const Slot& b) {
		const TextSpan& sa = a.*name_member;
		const TextSpan& sb = b.*name_member;
		return _data.substr(sa.offset, sa.length) < _data.substr(sb.offset, sb.length);
	});
}


std::vector<EntryStore::SectionSlot> EntryStore::Builder::Finish() const
{
	std::vector<SectionSlot> section_slots;
	section_slots.reserve(_sections.size());

	for (const auto& [section_name, attributes] : _sections) {
		SectionSlot section_slot;
		section_slot.name = SpanOf(section_name);
		section_slot.attributes.reserve(attributes.size());

		for (const auto& [attribute_name, attribute_value] : attributes) {
			AttributeSlot attribute_slot;
			attribute_slot.name = SpanOf(attribute_name);
			if (attribute_value.value) {
				attribute_slot.value = SpanOf(*attribute_value.value);
			}
			if (attribute_value.parameters) {
				auto& parameter_slots = attribute_slot.parameters.emplace();
				parameter_slots.reserve(attribute_value.parameters->size());
				for (const auto& [key, value] : *attribute_value.parameters) {
					parameter_slots.push_back({SpanOf(key), SpanOf(value)});
				}
				SortByName(parameter_slots, &ParameterSlot::key);
			}
			section_slot.attributes.push_back(std::move(attribute_slot));
		}

		SortByName(section_slot.attributes, &AttributeSlot::name);
		section_slots.push_back(std::move(section_slot));
	}

	SortByName(section_slots, &SectionSlot::name);
	return section_slots;
}



// ****************************** Construction ******************************

std::optional<EntryStore> EntryStore::Build(std::string data, ParseError* error)
{
	ParseError local_error;
	Builder builder(data);

	// Tokenize everything first so structural errors win over text errors.
	auto section_records = TokenizeAll(data, &local_error);
	if (!section_records) {
		g_debug("Entry rejected: %s", local_error.Describe().c_str());
		if (error) {
			*error = std::move(local_error);
		}
		return std::nullopt;
	}

	for (const auto& section_record : *section_records) {
		if (!builder.AddSection(section_record, &local_error)) {
			g_debug("Entry rejected: %s", local_error.Describe().c_str());
			if (error) {
				*error = std::move(local_error);
			}
			return std::nullopt;
		}
	}

	// Spans are computed against the buffer before it moves into the store.
	auto sections = builder.Finish();
	g_debug("Indexed %zu sections (%zu unique) from %zu bytes", section_records->size(), sections.size(), data.size());
	return EntryStore(std::move(data), std::move(sections));
}



// ****************************** Lookups ******************************

template <typename Slot>
const Slot* EntryStore::FindSlot(const std::vector<Slot>& slots, TextSpan Slot::* name_member, std::string_view name) const
{
	auto it = std::lower_bound(slots.begin(), slots.end(), name, [this, name_member](const Slot& slot, std::string_view key) {
		return Resolve(slot.*name_member) < key;
	});
	if (it != slots.end() && Resolve((*it).*name_member) == name) {
		return &*it;
	}
	return nullptr;
}


const EntryStore::SectionSlot* EntryStore::FindSection(std::string_view section) const
{
	return FindSlot(_sections, &SectionSlot::name, section);
}


const EntryStore::AttributeSlot* EntryStore::FindAttribute(std::string_view section, std::string_view attribute) const
{
	const SectionSlot* section_slot = FindSection(section);
	if (!section_slot) {
		return nullptr;
	}
	return FindSlot(section_slot->attributes, &AttributeSlot::name, attribute);
}


std::optional<std::string_view> EntryStore::Get(std::string_view section, std::string_view attribute,
	std::optional<std::string_view> parameter) const
{
	const AttributeSlot* attribute_slot = FindAttribute(section, attribute);
	if (!attribute_slot) {
		return std::nullopt;
	}

	if (!parameter) {
		if (!attribute_slot->value) {
			return std::nullopt;
		}
		return Resolve(*attribute_slot->value);
	}

	if (!attribute_slot->parameters) {
		return std::nullopt;
	}
	const ParameterSlot* parameter_slot = FindSlot(*attribute_slot->parameters, &ParameterSlot::key, *parameter);
	if (!parameter_slot) {
		return std::nullopt;
	}
	return Resolve(parameter_slot->value);
}


bool EntryStore::HasSection(std::string_view section) const
{
	return FindSection(section) != nullptr;
}


std::optional<std::string_view> EntryStore::FindSectionName(std::string_view section) const
{
	const SectionSlot* section_slot = FindSection(section);
	if (!section_slot) {
		return std::nullopt;
	}
	return Resolve(section_slot->name);
}


bool EntryStore::HasAttribute(std::string_view section, std::string_view attribute) const
{
	return FindAttribute(section, attribute) != nullptr;
}


bool EntryStore::HasParameter(std::string_view section, std::string_view attribute, std::string_view parameter) const
{
	return Get(section, attribute, parameter).has_value();
}


std::vector<std::string_view> EntryStore::SectionNames() const
{
	std::vector<std::string_view> names;
	names.reserve(_sections.size());
	for (const auto& section_slot : _sections) {
		names.push_back(Resolve(section_slot.name));
	}
	return names;
}


std::optional<std::vector<std::string_view>> EntryStore::AttributeNames(std::string_view section) const
{
	const SectionSlot* section_slot = FindSection(section);
	if (!section_slot) {
		return std::nullopt;
	}
	std::vector<std::string_view> names;
	names.reserve(section_slot->attributes.size());
	for (const auto& attribute_slot : section_slot->attributes) {
		names.push_back(Resolve(attribute_slot.name));
	}
	return names;
}


std::optional<std::vector<std::string_view>> EntryStore::ParameterKeys(std::string_view section, std::string_view attribute) const
{
	const AttributeSlot* attribute_slot = FindAttribute(section, attribute);
	if (!attribute_slot || !attribute_slot->parameters) {
		return std::nullopt;
	}
	std::vector<std::string_view> keys;
	keys.reserve(attribute_slot->parameters->size());
	for (const auto& parameter_slot : *attribute_slot->parameters) {
		keys.push_back(Resolve(parameter_slot.key));
	}
	return keys;
}

} // namespace XdgEntry
