#pragma once

#include "common.hpp"
#include "ParseError.hpp"
#include <ostream>
#include <string>

namespace XdgEntry {

// Development-time rendering of tokenizer records. Text that is not valid UTF-8 is shown as a byte dump.
//
//	AttributeRecord { name: "GenericName[es]", value: "Navegador web", parameter: AttributeParameter { base_name: "GenericName", key: "es" } }

std::string ToDebugString(const AttributeParameter& parameter);
std::string ToDebugString(const AttributeRecord& attribute);
std::string ToDebugString(const SectionRecord& section);

std::ostream& operator<<(std::ostream& os, const AttributeParameter& parameter);
std::ostream& operator<<(std::ostream& os, const AttributeRecord& attribute);
std::ostream& operator<<(std::ostream& os, const SectionRecord& section);
std::ostream& operator<<(std::ostream& os, const ParseError& error);

} // namespace XdgEntry
