#pragma once

#include "common.hpp"
#include "ParseError.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace XdgEntry {

// Lazy, single-pass reader of the sections of an entry file.
// The tokenizer never copies: every record it returns points into the input it was given,
// so the input must outlive the records. To read the same input again, create a new tokenizer.
class EntryTokenizer
{
public:

	explicit EntryTokenizer(std::string_view input) : _rest(input) {}

	// Produces the next section. Returns false when the input is exhausted or a section is malformed;
	// Failed() tells the two apart. A failure is reported once, after which the sequence is over.
	bool Next(SectionRecord& section, ParseError* error = nullptr);

	bool Failed() const { return _failed; }

	// Unconsumed input. After a failure this is where the failing section started.
	std::string_view Rest() const { return _rest; }


	// ******************************************************************************
	// Grammar steps. On success they advance 'rest' past what they consumed;
	// on failure 'rest' is left untouched and 'error' (if any) is filled in.
	// ******************************************************************************

	// "[Title]" -> "Title". The title is everything up to the next ']' and must not be empty.
	static std::optional<std::string_view> ParseHeader(std::string_view& rest, ParseError* error = nullptr);

	// Skips whitespace (space, tab, CR, LF) and '#' comment lines.
	static std::string_view SkipToNextLine(std::string_view input);

	// One "name=value" line, followed by a SkipToNextLine().
	static std::optional<AttributeRecord> ParseAttribute(std::string_view& rest, ParseError* error = nullptr);

	// Best-effort split of "Name[param]". Returns nullopt only if there is no '[' at all;
	// a missing ']' leaves the key running to the end of the name.
	static std::optional<AttributeParameter> ParseParameter(std::string_view name);

	// A header plus at least one attribute.
	static std::optional<SectionRecord> ParseSection(std::string_view& rest, ParseError* error = nullptr);

private:
	std::string_view _rest;
	bool _failed = false;
};


inline EntryTokenizer Tokenize(std::string_view input)
{
	return EntryTokenizer(input);
}

// Reads every section of input, stopping at the first error. Nothing is returned on failure.
std::optional<std::vector<SectionRecord>> TokenizeAll(std::string_view input, ParseError* error = nullptr);

} // namespace XdgEntry
