// ValueParser – Umwandlung von Text-Literalen in typisierte OPC-UA-Werte
//
// convertLiteral     : Literal + Zieltyp -> UAScalar. Ganzzahlen werden auf den
//                      Wertebereich des Zieltyps geprüft ("70000" als Int16 -> Fehler).
// parseByteString    : "43 45 DE", "0x43,0x45,0xDE", "hex:4345de" -> 3 Bytes;
//                      "ascii:abcd" / "text:abcd" -> Rohbytes; sonst Hex falls möglich,
//                      ansonsten die Rohbytes des Literals.
// parseArrayLiteral  : "[1, 2, 3]" bzw. "1,2,3" -> homogenes UAArray des Elementtyps.
// parseDateTime      : "now", RFC 3339, "YYYY-MM-DD HH:MM:SS[.mmm]" (UTC).
//
// Fehler werden über err gemeldet, es wird nie geworfen.
#pragma once
#include "common_types.h"
#include <string>
#include <vector>

bool convertLiteral(const std::string& literal, BuiltinType type, UAScalar& out, std::string& err);

std::vector<uint8_t> parseByteString(const std::string& literal);

bool parseArrayLiteral(const std::string& literal, BuiltinType elemType, UAArray& out, std::string& err);

bool parseDateTime(const std::string& literal, int64_t& unixMsOut);

// Element-Typen, die als Array geschrieben werden können
bool isArrayElementTypeSupported(BuiltinType t);
