// ValueFormat – Darstellung von OPC-UA-Werten und Attributen als Text
//
// builtinTypeName     : BuiltinType -> "Int32", "Float", ...
// builtinFromName     : tolerante Rückrichtung ("int32", "float32", "bool", "Boolean", ...)
// dataTypeNameFromId  : DataType-NodeId ("i=6") -> "Int32", sonst die NodeId selbst
// formatAccessLevel   : Bitmaske -> "Read, Write" bzw. "None"
// formatValue         : Wert gemäß deklariertem Typ (ByteString je nach Knotentyp als
//                       Hex oder Text, DateTime als "YYYY-MM-DD HH:MM:SS.mmm" UTC)
// formatClock         : Zeitstempel "HH:MM:SS.mmm" (lokale Zeit) für Watch-Einträge
#pragma once
#include "common_types.h"
#include <cstdint>
#include <string>

const char* builtinTypeName(BuiltinType t);
BuiltinType builtinFromName(const std::string& name);
BuiltinType builtinFromNodeId(const std::string& dataTypeId);
std::string dataTypeNameFromId(const std::string& dataTypeId);

std::string formatAccessLevel(uint8_t mask);

std::string formatScalar(const UAScalar& v, BuiltinType declared = BuiltinType::Unknown);
std::string formatValue(const UAValue& v, BuiltinType declared = BuiltinType::Unknown);

std::string formatDateTime(int64_t unixMs);
std::string formatClock(int64_t unixMs);
int64_t     nowUnixMs();

std::string toHex(const std::vector<uint8_t>& bytes, bool upperSpaced);
