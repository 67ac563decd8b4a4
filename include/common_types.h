// common_types.h – Grundtypen für OPC-UA-Werte
//
// BuiltinType : die OPC-UA Built-in-Datentypen (numerische Ids aus ns=0, 1..25).
// UAScalar    : Variant über alle schreib-/lesbaren Skalare (Boolean .. LocalizedText).
//               NodeIdValue kommt nur beim Lesen vor (DataType-Attribut).
// UAArray     : homogenes Array aus UAScalar (ein Elementtyp je Array).
// UAValue     : null | Skalar | Array – wird einmal beim Parsen entschieden und erst an
//               der Transportgrenze (OpcUaSession) auf UA_Variant abgebildet.
//
// tagOf(...) / typeOf(...) : Typkennung eines Wertes (Text bzw. BuiltinType).
// almostEqual / equalUA    : toleranter Vergleich (Float/Double) für Tests und Read-Back.
#pragma once
#include <variant>
#include <vector>
#include <string>
#include <cstdint>
#include <algorithm>
#include <cmath>

enum class BuiltinType : int {
    Unknown = 0,
    Boolean = 1, SByte = 2, Byte = 3, Int16 = 4, UInt16 = 5, Int32 = 6, UInt32 = 7,
    Int64 = 8, UInt64 = 9, Float = 10, Double = 11, String = 12, DateTime = 13,
    Guid = 14, ByteString = 15, XmlElement = 16, NodeId = 17, ExpandedNodeId = 18,
    StatusCode = 19, QualifiedName = 20, LocalizedText = 21, ExtensionObject = 22,
    DataValue = 23, Variant = 24, DiagnosticInfo = 25
};

struct ByteString {
    std::vector<uint8_t> bytes;
    bool operator==(const ByteString& o) const { return bytes == o.bytes; }
};

// Millisekunden seit Unix-Epoche (UTC)
struct DateTime {
    int64_t unixMs = 0;
    bool operator==(const DateTime& o) const { return unixMs == o.unixMs; }
};

struct LocalizedText {
    std::string locale;
    std::string text;
    bool operator==(const LocalizedText& o) const { return locale == o.locale && text == o.text; }
};

// Textform einer NodeId ("i=6", "ns=2;s=Foo")
struct NodeIdValue {
    std::string id;
    bool operator==(const NodeIdValue& o) const { return id == o.id; }
};

using UAScalar = std::variant<bool, int8_t, uint8_t, int16_t, uint16_t, int32_t, uint32_t,
                              int64_t, uint64_t, float, double, std::string,
                              ByteString, DateTime, LocalizedText, NodeIdValue>;
using UAArray  = std::vector<UAScalar>;
using UAValue  = std::variant<std::monostate, UAScalar, UAArray>;

inline BuiltinType typeOf(const UAScalar& s) {
    switch (s.index()) {
        case 0:  return BuiltinType::Boolean;
        case 1:  return BuiltinType::SByte;
        case 2:  return BuiltinType::Byte;
        case 3:  return BuiltinType::Int16;
        case 4:  return BuiltinType::UInt16;
        case 5:  return BuiltinType::Int32;
        case 6:  return BuiltinType::UInt32;
        case 7:  return BuiltinType::Int64;
        case 8:  return BuiltinType::UInt64;
        case 9:  return BuiltinType::Float;
        case 10: return BuiltinType::Double;
        case 11: return BuiltinType::String;
        case 12: return BuiltinType::ByteString;
        case 13: return BuiltinType::DateTime;
        case 14: return BuiltinType::LocalizedText;
        case 15: return BuiltinType::NodeId;
        default: return BuiltinType::Unknown;
    }
}

// Typ des Wertes; bei Arrays der Elementtyp (leeres Array -> Unknown)
inline BuiltinType typeOf(const UAValue& v) {
    if (auto s = std::get_if<UAScalar>(&v)) return typeOf(*s);
    if (auto a = std::get_if<UAArray>(&v))  return a->empty() ? BuiltinType::Unknown : typeOf(a->front());
    return BuiltinType::Unknown;
}

inline bool isArray(const UAValue& v) { return std::holds_alternative<UAArray>(v); }
inline bool isNull(const UAValue& v)  { return std::holds_alternative<std::monostate>(v); }

// Liefert eine einfache Typkennung als Text (z. B. "int16", "double", "int32[]").
inline std::string tagOf(const UAValue& v) {
    static const char* names[] = { "bool", "sbyte", "byte", "int16", "uint16", "int32", "uint32",
                                   "int64", "uint64", "float", "double", "string",
                                   "bytestring", "datetime", "localizedtext", "nodeid" };
    if (auto s = std::get_if<UAScalar>(&v)) return names[s->index()];
    if (auto a = std::get_if<UAArray>(&v)) {
        if (a->empty()) return "array";
        return std::string(names[a->front().index()]) + "[]";
    }
    return "null";
}

// Toleranter Vergleich von double-Werten nach relative/absolute Toleranz.
inline bool almostEqual(double a, double b, double relTol = 1e-6, double absTol = 1e-9) {
    const double diff  = std::fabs(a - b);
    const double scale = (std::max)(std::fabs(a), std::fabs(b)); // Klammern gegen Windows-Makros
    const double thr   = (std::max)(absTol, relTol * scale);
    return diff <= thr;
}

inline bool equalScalar(const UAScalar& a, const UAScalar& b,
                        double relTol = 1e-6, double absTol = 1e-9) {
    if (a.index() != b.index()) return false;
    return std::visit([&](auto&& x)->bool{
        using T = std::decay_t<decltype(x)>;
        const T& y = std::get<T>(b);
        if constexpr (std::is_same_v<T,float>)  return almostEqual((double)x, (double)y, relTol, absTol);
        else if constexpr (std::is_same_v<T,double>) return almostEqual(x, y, relTol, absTol);
        else return x == y;
    }, a);
}

// Vergleich zweier UAValue (Float/Double tolerant)
inline bool equalUA(const UAValue& a, const UAValue& b,
                    double relTol = 1e-6, double absTol = 1e-9) {
    if (a.index() != b.index()) return false;
    if (auto sa = std::get_if<UAScalar>(&a))
        return equalScalar(*sa, std::get<UAScalar>(b), relTol, absTol);
    if (auto aa = std::get_if<UAArray>(&a)) {
        const auto& ab = std::get<UAArray>(b);
        if (aa->size() != ab.size()) return false;
        for (size_t i = 0; i < aa->size(); ++i)
            if (!equalScalar((*aa)[i], ab[i], relTol, absTol)) return false;
        return true;
    }
    return true; // beide null
}
