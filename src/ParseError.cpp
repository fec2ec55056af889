#include "ParseError.hpp"
#include "Utf8.hpp"
#include <utility>

namespace XdgEntry {

ParseError ParseError::Structural(Stage stage, std::string_view remaining)
{
	ParseError error;
	error._kind = Kind::Structural;
	error._stage = stage;
	error._remaining.assign(remaining.data(), remaining.size());
	return error;
}


ParseError ParseError::Incomplete(Stage stage)
{
	ParseError error;
	error._kind = Kind::Incomplete;
	error._stage = stage;
	return error;
}


ParseError ParseError::InvalidUtf8(std::string_view bytes)
{
	ParseError error;
	error._kind = Kind::InvalidUtf8;
	error._remaining.assign(bytes.data(), bytes.size());
	return error;
}


ParseError ParseError::FileRead(std::string path, std::string message)
{
	ParseError error;
	error._kind = Kind::FileRead;
	error._path = std::move(path);
	error._message = std::move(message);
	return error;
}


std::string ParseError::RemainingText() const
{
	return TextOrByteDump(_remaining);
}


std::string ParseError::Describe() const
{
	switch (_kind) {
	case Kind::Structural:
		return std::string("Error parsing input: ") + StageName(_stage) + " at `" + RemainingText() + "`";
	case Kind::Incomplete:
		return std::string("Incomplete input: ") + StageName(_stage) + " is not terminated";
	case Kind::InvalidUtf8:
		return "Error parsing string to utf8: " + FormatByteDump(_remaining);
	case Kind::FileRead:
		return "Cannot read '" + _path + "': " + _message;
	}
	return KindName(_kind);
}


const char* ParseError::KindName(Kind kind)
{
	switch (kind) {
	case Kind::Structural:  return "structural";
	case Kind::Incomplete:  return "incomplete";
	case Kind::InvalidUtf8: return "invalid-utf8";
	case Kind::FileRead:    return "file-read";
	}
	return "unknown";
}


const char* ParseError::StageName(Stage stage)
{
	switch (stage) {
	case Stage::None:          return "none";
	case Stage::Header:        return "section header";
	case Stage::Attribute:     return "attribute";
	case Stage::AttributeList: return "attribute list";
	}
	return "unknown";
}

} // namespace XdgEntry
