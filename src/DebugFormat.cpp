#include "DebugFormat.hpp"
#include "Utf8.hpp"

namespace XdgEntry {

static std::string QuoteOrDump(std::string_view bytes)
{
	if (IsValidUtf8(bytes)) {
		std::string out;
		out.reserve(bytes.size() + 2);
		out.push_back('"');
		for (char c : bytes) {
			switch (c) {
			case '"':  out.append("\\\""); break;
			case '\\': out.append("\\\\"); break;
			case '\n': out.append("\\n"); break;
			case '\r': out.append("\\r"); break;
			case '\t': out.append("\\t"); break;
			default:   out.push_back(c); break;
			}
		}
		out.push_back('"');
		return out;
	}
	return FormatByteDump(bytes);
}


std::string ToDebugString(const AttributeParameter& parameter)
{
	return "AttributeParameter { base_name: " + QuoteOrDump(parameter.base_name)
		+ ", key: " + QuoteOrDump(parameter.key) + " }";
}


std::string ToDebugString(const AttributeRecord& attribute)
{
	return "AttributeRecord { name: " + QuoteOrDump(attribute.name)
		+ ", value: " + QuoteOrDump(attribute.value)
		+ ", parameter: " + (attribute.parameter ? ToDebugString(*attribute.parameter) : std::string("None")) + " }";
}


std::string ToDebugString(const SectionRecord& section)
{
	std::string out = "SectionRecord { title: " + QuoteOrDump(section.title) + ", attributes: [";
	for (size_t i = 0; i < section.attributes.size(); ++i) {
		out.append(i == 0 ? "" : ", ");
		out.append(ToDebugString(section.attributes[i]));
	}
	out.append("] }");
	return out;
}


std::ostream& operator<<(std::ostream& os, const AttributeParameter& parameter)
{
	return os << ToDebugString(parameter);
}


std::ostream& operator<<(std::ostream& os, const AttributeRecord& attribute)
{
	return os << ToDebugString(attribute);
}


std::ostream& operator<<(std::ostream& os, const SectionRecord& section)
{
	return os << ToDebugString(section);
}


std::ostream& operator<<(std::ostream& os, const ParseError& error)
{
	return os << error.Describe();
}

} // namespace XdgEntry
