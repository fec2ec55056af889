#include "EntryTokenizer.hpp"
#include <utility>

namespace XdgEntry {

static bool IsLineSpace(char c)
{
	return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}


static void SetError(ParseError* error, ParseError value)
{
	if (error) {
		*error = std::move(value);
	}
}


bool EntryTokenizer::Next(SectionRecord& section, ParseError* error)
{
	if (_failed) {
		return false;
	}

	// Skip the preamble before the first header.
	auto start_pos = _rest.find('[');
	if (start_pos == std::string_view::npos) {
		_rest = _rest.substr(_rest.size());
		return false;
	}
	_rest.remove_prefix(start_pos);

	std::string_view rest = _rest;
	auto parsed = ParseSection(rest, error);
	if (!parsed) {
		_failed = true;
		return false;
	}

	_rest = rest;
	section = std::move(*parsed);
	return true;
}


std::optional<std::string_view> EntryTokenizer::ParseHeader(std::string_view& rest, ParseError* error)
{
	if (rest.empty() || rest.front() != '[') {
		SetError(error, ParseError::Structural(ParseError::Stage::Header, rest));
		return std::nullopt;
	}

	auto close_pos = rest.find(']', 1);
	if (close_pos == std::string_view::npos) {
		SetError(error, ParseError::Incomplete(ParseError::Stage::Header));
		return std::nullopt;
	}
	if (close_pos == 1) {
		SetError(error, ParseError::Structural(ParseError::Stage::Header, rest.substr(1)));
		return std::nullopt;
	}

	std::string_view title = rest.substr(1, close_pos - 1);
	rest.remove_prefix(close_pos + 1);
	return title;
}


std::string_view EntryTokenizer::SkipToNextLine(std::string_view input)
{
	for (;;) {
		size_t pos = 0;
		while (pos < input.size() && IsLineSpace(input[pos])) {
			++pos;
		}
		input.remove_prefix(pos);

		if (input.empty() || input.front() != '#') {
			return input;
		}

		// Drop the comment up to (not including) its newline; the newline goes with the next round.
		auto eol_pos = input.find('\n');
		input.remove_prefix(eol_pos == std::string_view::npos ? input.size() : eol_pos);
	}
}


std::optional<AttributeRecord> EntryTokenizer::ParseAttribute(std::string_view& rest, ParseError* error)
{
	if (rest.empty() || rest.front() == '[') {
		SetError(error, ParseError::Structural(ParseError::Stage::Attribute, rest));
		return std::nullopt;
	}

	auto eol_pos = rest.find('\n');
	std::string_view line = rest.substr(0, eol_pos);
	auto eq_pos = line.find('=');
	if (eq_pos == std::string_view::npos) {
		SetError(error, ParseError::Structural(ParseError::Stage::Attribute, rest));
		return std::nullopt;
	}

	AttributeRecord attribute;
	attribute.name = line.substr(0, eq_pos);
	attribute.value = line.substr(eq_pos + 1);
	attribute.parameter = ParseParameter(attribute.name);

	rest = SkipToNextLine(rest.substr(line.size()));
	return attribute;
}


std::optional<AttributeParameter> EntryTokenizer::ParseParameter(std::string_view name)
{
	auto open_pos = name.find('[');
	if (open_pos == std::string_view::npos) {
		return std::nullopt;
	}

	AttributeParameter parameter;
	parameter.base_name = name.substr(0, open_pos);
	std::string_view tail = name.substr(open_pos + 1);
	parameter.key = tail.substr(0, tail.find(']'));
	return parameter;
}


std::optional<SectionRecord> EntryTokenizer::ParseSection(std::string_view& rest, ParseError* error)
{
	std::string_view cursor = rest;

	auto title = ParseHeader(cursor, error);
	if (!title) {
		return std::nullopt;
	}
	cursor = SkipToNextLine(cursor);

	SectionRecord section;
	section.title = *title;

	while (!cursor.empty() && cursor.front() != '[') {
		auto attribute = ParseAttribute(cursor, error);
		if (!attribute) {
			return std::nullopt;
		}
		section.attributes.push_back(std::move(*attribute));
	}

	if (section.attributes.empty()) {
		SetError(error, ParseError::Structural(ParseError::Stage::AttributeList, cursor));
		return std::nullopt;
	}

	rest = cursor;
	return section;
}


std::optional<std::vector<SectionRecord>> TokenizeAll(std::string_view input, ParseError* error)
{
	std::vector<SectionRecord> sections;
	EntryTokenizer tokenizer(input);
	SectionRecord section;
	while (tokenizer.Next(section, error)) {
		sections.push_back(std::move(section));
	}
	if (tokenizer.Failed()) {
		return std::nullopt;
	}
	return sections;
}

} // namespace XdgEntry
