#include "ValueFormat.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::tm splitTime(int64_t unixMs, bool local) {
    std::time_t t = static_cast<std::time_t>(unixMs / 1000);
    if (unixMs < 0 && unixMs % 1000 != 0) --t;
    std::tm tm{};
#if defined(_WIN32)
    if (local) localtime_s(&tm, &t); else gmtime_s(&tm, &t);
#else
    if (local) localtime_r(&t, &tm); else gmtime_r(&t, &tm);
#endif
    return tm;
}

int millisOf(int64_t unixMs) {
    int ms = static_cast<int>(unixMs % 1000);
    return ms < 0 ? ms + 1000 : ms;
}
} // namespace

const char* builtinTypeName(BuiltinType t) {
    switch (t) {
        case BuiltinType::Boolean:         return "Boolean";
        case BuiltinType::SByte:           return "SByte";
        case BuiltinType::Byte:            return "Byte";
        case BuiltinType::Int16:           return "Int16";
        case BuiltinType::UInt16:          return "UInt16";
        case BuiltinType::Int32:           return "Int32";
        case BuiltinType::UInt32:          return "UInt32";
        case BuiltinType::Int64:           return "Int64";
        case BuiltinType::UInt64:          return "UInt64";
        case BuiltinType::Float:           return "Float";
        case BuiltinType::Double:          return "Double";
        case BuiltinType::String:          return "String";
        case BuiltinType::DateTime:        return "DateTime";
        case BuiltinType::Guid:            return "Guid";
        case BuiltinType::ByteString:      return "ByteString";
        case BuiltinType::XmlElement:      return "XmlElement";
        case BuiltinType::NodeId:          return "NodeId";
        case BuiltinType::ExpandedNodeId:  return "ExpandedNodeId";
        case BuiltinType::StatusCode:      return "StatusCode";
        case BuiltinType::QualifiedName:   return "QualifiedName";
        case BuiltinType::LocalizedText:   return "LocalizedText";
        case BuiltinType::ExtensionObject: return "ExtensionObject";
        case BuiltinType::DataValue:       return "DataValue";
        case BuiltinType::Variant:         return "Variant";
        case BuiltinType::DiagnosticInfo:  return "DiagnosticInfo";
        default:                           return "Unknown";
    }
}

BuiltinType builtinFromName(const std::string& name) {
    const std::string n = lower(name);
    if (n == "bool" || n == "boolean")                      return BuiltinType::Boolean;
    if (n == "sbyte" || n == "int8")                        return BuiltinType::SByte;
    if (n == "byte" || n == "uint8")                        return BuiltinType::Byte;
    if (n == "int16")                                       return BuiltinType::Int16;
    if (n == "uint16")                                      return BuiltinType::UInt16;
    if (n == "int32")                                       return BuiltinType::Int32;
    if (n == "uint32")                                      return BuiltinType::UInt32;
    if (n == "int64")                                       return BuiltinType::Int64;
    if (n == "uint64")                                      return BuiltinType::UInt64;
    if (n == "float" || n == "float32")                     return BuiltinType::Float;
    if (n == "double" || n == "float64")                    return BuiltinType::Double;
    if (n == "string")                                      return BuiltinType::String;
    if (n == "datetime")                                    return BuiltinType::DateTime;
    if (n == "bytestring")                                  return BuiltinType::ByteString;
    if (n == "localizedtext")                               return BuiltinType::LocalizedText;
    if (n == "nodeid")                                      return BuiltinType::NodeId;
    return BuiltinType::Unknown;
}

BuiltinType builtinFromNodeId(const std::string& dataTypeId) {
    // nur ns=0 numerisch 1..25 ist ein Built-in-Typ
    if (dataTypeId.rfind("i=", 0) != 0) return BuiltinType::Unknown;
    const std::string num = dataTypeId.substr(2);
    if (num.empty() || num.size() > 2 ||
        !std::all_of(num.begin(), num.end(), [](unsigned char c){ return std::isdigit(c); }))
        return BuiltinType::Unknown;
    const int v = std::stoi(num);
    if (v < 1 || v > 25) return BuiltinType::Unknown;
    return static_cast<BuiltinType>(v);
}

std::string dataTypeNameFromId(const std::string& dataTypeId) {
    const BuiltinType t = builtinFromNodeId(dataTypeId);
    if (t == BuiltinType::Unknown) return dataTypeId;
    return builtinTypeName(t);
}

std::string formatAccessLevel(uint8_t mask) {
    static const struct { uint8_t bit; const char* name; } kBits[] = {
        { 0x01, "Read" }, { 0x02, "Write" }, { 0x04, "HistoryRead" }, { 0x08, "HistoryWrite" },
        { 0x10, "SemanticChange" }, { 0x20, "StatusWrite" }, { 0x40, "TimestampWrite" },
    };
    std::string out;
    for (const auto& b : kBits) {
        if (!(mask & b.bit)) continue;
        if (!out.empty()) out += ", ";
        out += b.name;
    }
    return out.empty() ? "None" : out;
}

std::string toHex(const std::vector<uint8_t>& bytes, bool upperSpaced) {
    std::string out;
    char buf[4];
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (upperSpaced && i) out.push_back(' ');
        std::snprintf(buf, sizeof(buf), upperSpaced ? "%02X" : "%02x", bytes[i]);
        out += buf;
    }
    return out;
}

std::string formatDateTime(int64_t unixMs) {
    const std::tm tm = splitTime(unixMs, false);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millisOf(unixMs));
    return buf;
}

std::string formatClock(int64_t unixMs) {
    const std::tm tm = splitTime(unixMs, true);
    char buf[20];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d",
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millisOf(unixMs));
    return buf;
}

int64_t nowUnixMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string formatScalar(const UAScalar& v, BuiltinType declared) {
    return std::visit([&](auto&& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, uint8_t>) {
            return std::to_string(static_cast<int>(x));
        } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
            std::ostringstream os; os << x; return os.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, ByteString>) {
            if (declared == BuiltinType::String)
                return std::string(x.bytes.begin(), x.bytes.end());
            return toHex(x.bytes, declared != BuiltinType::ByteString);
        } else if constexpr (std::is_same_v<T, DateTime>) {
            return formatDateTime(x.unixMs);
        } else if constexpr (std::is_same_v<T, LocalizedText>) {
            return x.text;
        } else if constexpr (std::is_same_v<T, NodeIdValue>) {
            return x.id;
        } else {
            return std::to_string(x);
        }
    }, v);
}

std::string formatValue(const UAValue& v, BuiltinType declared) {
    if (auto s = std::get_if<UAScalar>(&v)) return formatScalar(*s, declared);
    if (auto a = std::get_if<UAArray>(&v)) {
        std::string out = "[";
        for (size_t i = 0; i < a->size(); ++i) {
            if (i) out += ", ";
            out += formatScalar((*a)[i], declared);
        }
        return out + "]";
    }
    return "<null>";
}
