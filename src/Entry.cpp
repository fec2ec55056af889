#include "Entry.hpp"
#include "EntryFileLoader.hpp"
#include <utility>

namespace XdgEntry {

// ****************************** SectionSelector ******************************

SectionSelector::SectionSelector(const EntryStore& store, std::string_view name) : _store(&store)
{
	if (auto stored_name = store.FindSectionName(name)) {
		_exists = true;
		_name = *stored_name;
	} else {
		_missing_name.assign(name.data(), name.size());
	}
}


std::optional<std::string_view> SectionSelector::Attr(std::string_view name) const
{
	if (!_exists) {
		return std::nullopt;
	}
	return _store->Get(_name, name);
}


std::optional<std::string_view> SectionSelector::AttrWithParam(std::string_view name, std::string_view param) const
{
	if (!_exists) {
		return std::nullopt;
	}
	return _store->Get(_name, name, param);
}


bool SectionSelector::HasAttr(std::string_view name) const
{
	return _exists && _store->HasAttribute(_name, name);
}


std::optional<std::vector<std::string_view>> SectionSelector::AttrNames() const
{
	if (!_exists) {
		return std::nullopt;
	}
	return _store->AttributeNames(_name);
}


std::optional<std::vector<std::string_view>> SectionSelector::ParamKeys(std::string_view name) const
{
	if (!_exists) {
		return std::nullopt;
	}
	return _store->ParameterKeys(_name, name);
}



// ****************************** Entry ******************************

std::optional<Entry> Entry::Parse(std::string data, ParseError* error)
{
	auto store = EntryStore::Build(std::move(data), error);
	if (!store) {
		return std::nullopt;
	}
	return Entry(std::move(*store));
}


std::optional<Entry> Entry::ParseFile(const std::string& path, ParseError* error)
{
	auto contents = LoadFileContents(path, error);
	if (!contents) {
		return std::nullopt;
	}
	return Parse(std::move(*contents), error);
}


std::vector<SectionSelector> Entry::Sections() const
{
	std::vector<SectionSelector> selectors;
	for (std::string_view name : _store.SectionNames()) {
		selectors.push_back(SectionSelector(_store, name));
	}
	return selectors;
}

} // namespace XdgEntry
