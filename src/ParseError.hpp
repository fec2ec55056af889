#pragma once

#include <string>
#include <string_view>

namespace XdgEntry {

class ParseError
{
public:

	enum class Kind
	{
		Structural,   // malformed header or attribute line, or a section without attributes
		Incomplete,   // input ended inside a construct that needed more bytes
		InvalidUtf8,  // a slice the index treats as text is not valid UTF-8
		FileRead      // the file could not be read before parsing started
	};

	// Tokenizer stage that rejected the input. Only meaningful for Structural and Incomplete.
	enum class Stage
	{
		None,
		Header,
		Attribute,
		AttributeList
	};

	ParseError() = default;

	static ParseError Structural(Stage stage, std::string_view remaining);
	static ParseError Incomplete(Stage stage);
	static ParseError InvalidUtf8(std::string_view bytes);
	static ParseError FileRead(std::string path, std::string message);

	Kind GetKind() const { return _kind; }
	Stage GetStage() const { return _stage; }

	// Unparsed input at the point of failure, or the offending bytes for InvalidUtf8.
	const std::string& Remaining() const { return _remaining; }

	// Remaining() as text if it is valid UTF-8, otherwise as a byte dump like "[0x66, 0xff]".
	std::string RemainingText() const;

	std::string Describe() const;

	static const char* KindName(Kind kind);
	static const char* StageName(Stage stage);

private:
	Kind _kind = Kind::Structural;
	Stage _stage = Stage::None;
	std::string _remaining;
	std::string _path;
	std::string _message;
};

} // namespace XdgEntry
