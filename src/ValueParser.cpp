#include "ValueParser.h"
#include "ValueFormat.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <type_traits>

namespace {
std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool startsWithCI(const std::string& s, const char* prefix) {
    const std::string p(prefix);
    return s.size() >= p.size() && lower(s.substr(0, p.size())) == p;
}

template<class T>
bool parseInteger(const std::string& text, T& out, std::string& err, const char* typeName) {
    std::string s = trim(text);
    if (!s.empty() && s[0] == '+') s.erase(0, 1);
    if (s.empty()) { err = std::string("empty literal for ") + typeName; return false; }
    if constexpr (std::is_unsigned_v<T>) {
        if (s[0] == '-') { err = "value " + text + " out of range for " + typeName; return false; }
    }
    // breite Zwischentypen, damit Bereichsfehler sauber erkannt werden
    using Wide = std::conditional_t<std::is_signed_v<T>, long long, unsigned long long>;
    Wide v{};
    const auto res = std::from_chars(s.data(), s.data() + s.size(), v, 10);
    if (res.ec == std::errc::result_out_of_range) {
        err = "value " + text + " out of range for " + typeName; return false;
    }
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        err = "invalid " + std::string(typeName) + " literal '" + text + "'"; return false;
    }
    if (v < static_cast<Wide>((std::numeric_limits<T>::min)()) ||
        v > static_cast<Wide>((std::numeric_limits<T>::max)())) {
        err = "value " + text + " out of range for " + typeName; return false;
    }
    out = static_cast<T>(v);
    return true;
}

bool parseDouble(const std::string& text, double& out, std::string& err) {
    const std::string s = trim(text);
    if (s.empty()) { err = "empty literal for Double"; return false; }
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) { err = "invalid Double literal '" + text + "'"; return false; }
    if (errno == ERANGE && std::isinf(v)) { err = "value " + text + " out of range for Double"; return false; }
    out = v;
    return true;
}

bool parseFloat(const std::string& text, float& out, std::string& err) {
    double d = 0;
    if (!parseDouble(text, d, err)) { err = "invalid Float literal '" + text + "'"; return false; }
    if (std::isfinite(d) && std::fabs(d) > (std::numeric_limits<float>::max)()) {
        err = "value " + text + " out of range for Float"; return false;
    }
    out = static_cast<float>(d);
    return true;
}

bool parseBool(const std::string& text, bool& out, std::string& err) {
    const std::string s = lower(trim(text));
    if (s == "1" || s == "t" || s == "true")  { out = true;  return true; }
    if (s == "0" || s == "f" || s == "false") { out = false; return true; }
    err = "invalid Boolean literal '" + text + "'";
    return false;
}

bool isHexDigit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

int hexVal(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

// Tage seit 1970-01-01 für ein proleptisch-gregorianisches Datum
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

// "YYYY-MM-DD?HH:MM:SS[.fff][Z|+hh:mm|-hh:mm]" mit ? in {'T',' '}
bool parseIsoLike(const std::string& s, int64_t& unixMs) {
    int Y, M, D, h, m, sec;
    char sep;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &Y, &M, &D, &sep, &h, &m, &sec, &consumed) != 7)
        return false;
    if (sep != 'T' && sep != 't' && sep != ' ') return false;
    if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || sec > 60) return false;

    size_t pos = static_cast<size_t>(consumed);
    int64_t ms = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 3) ms = ms * 10 + (s[pos] - '0');
            ++digits; ++pos;
        }
        if (digits == 0) return false;
        for (int i = digits; i < 3; ++i) ms *= 10;
    }
    int64_t offsetMin = 0;
    if (pos < s.size()) {
        if (s[pos] == 'Z' || s[pos] == 'z') {
            ++pos;
        } else if (s[pos] == '+' || s[pos] == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return false;
            offsetMin = (oh * 60 + om) * (s[pos] == '-' ? -1 : 1);
            pos += 6;
        }
    }
    if (pos != s.size()) return false;

    const int64_t days = daysFromCivil(Y, static_cast<unsigned>(M), static_cast<unsigned>(D));
    const int64_t secs = days * 86400 + h * 3600 + m * 60 + sec - offsetMin * 60;
    unixMs = secs * 1000 + ms;
    return true;
}
} // namespace

std::vector<uint8_t> parseByteString(const std::string& literal) {
    const std::string raw = literal;
    std::string s = trim(literal);
    if (s.empty()) return {};

    if (startsWithCI(s, "ascii:")) { const std::string t = trim(s.substr(6)); return { t.begin(), t.end() }; }
    if (startsWithCI(s, "text:"))  { const std::string t = trim(s.substr(5)); return { t.begin(), t.end() }; }
    if (startsWithCI(s, "hex:"))   s = trim(s.substr(4));

    // Token an Leer-/Trennzeichen zerlegen, "0x" je Token entfernen
    std::string hex;
    std::string tok;
    auto flush = [&] {
        if (tok.size() >= 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X')) tok.erase(0, 2);
        hex += tok;
        tok.clear();
    };
    for (char c : s) {
        if (c == ' ' || c == ',' || c == ';' || c == ':' || c == '\t') flush();
        else tok.push_back(c);
    }
    flush();

    const bool looksHex = !hex.empty() && hex.size() % 2 == 0 &&
                          std::all_of(hex.begin(), hex.end(), isHexDigit);
    if (!looksHex) return { raw.begin(), raw.end() };

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
        out.push_back(static_cast<uint8_t>(hexVal(hex[i]) * 16 + hexVal(hex[i + 1])));
    return out;
}

bool parseDateTime(const std::string& literal, int64_t& unixMsOut) {
    const std::string s = trim(literal);
    if (lower(s) == "now") { unixMsOut = nowUnixMs(); return true; }
    return parseIsoLike(s, unixMsOut);
}

bool convertLiteral(const std::string& literal, BuiltinType type, UAScalar& out, std::string& err) {
    switch (type) {
        case BuiltinType::Boolean: { bool v;     if (!parseBool(literal, v, err)) return false; out = v; return true; }
        case BuiltinType::SByte:   { int8_t v;   if (!parseInteger(literal, v, err, "SByte"))  return false; out = v; return true; }
        case BuiltinType::Byte:    { uint8_t v;  if (!parseInteger(literal, v, err, "Byte"))   return false; out = v; return true; }
        case BuiltinType::Int16:   { int16_t v;  if (!parseInteger(literal, v, err, "Int16"))  return false; out = v; return true; }
        case BuiltinType::UInt16:  { uint16_t v; if (!parseInteger(literal, v, err, "UInt16")) return false; out = v; return true; }
        case BuiltinType::Int32:   { int32_t v;  if (!parseInteger(literal, v, err, "Int32"))  return false; out = v; return true; }
        case BuiltinType::UInt32:  { uint32_t v; if (!parseInteger(literal, v, err, "UInt32")) return false; out = v; return true; }
        case BuiltinType::Int64:   { int64_t v;  if (!parseInteger(literal, v, err, "Int64"))  return false; out = v; return true; }
        case BuiltinType::UInt64:  { uint64_t v; if (!parseInteger(literal, v, err, "UInt64")) return false; out = v; return true; }
        case BuiltinType::Float:   { float v;    if (!parseFloat(literal, v, err))  return false; out = v; return true; }
        case BuiltinType::Double:  { double v;   if (!parseDouble(literal, v, err)) return false; out = v; return true; }
        case BuiltinType::String:
            out = literal;
            return true;
        case BuiltinType::ByteString:
            out = ByteString{ parseByteString(literal) };
            return true;
        case BuiltinType::DateTime: {
            int64_t ms = 0;
            if (!parseDateTime(literal, ms)) { err = "invalid DateTime literal '" + literal + "'"; return false; }
            out = DateTime{ ms };
            return true;
        }
        case BuiltinType::LocalizedText: {
            const size_t bar = literal.find('|');
            if (bar == std::string::npos) out = LocalizedText{ "", literal };
            else out = LocalizedText{ literal.substr(0, bar), literal.substr(bar + 1) };
            return true;
        }
        default:
            err = std::string("unsupported data type: ") + builtinTypeName(type);
            return false;
    }
}

bool isArrayElementTypeSupported(BuiltinType t) {
    switch (t) {
        case BuiltinType::Boolean: case BuiltinType::SByte: case BuiltinType::Byte:
        case BuiltinType::Int16:   case BuiltinType::UInt16:
        case BuiltinType::Int32:   case BuiltinType::UInt32:
        case BuiltinType::Int64:   case BuiltinType::UInt64:
        case BuiltinType::Float:   case BuiltinType::Double:
        case BuiltinType::String:  case BuiltinType::DateTime: case BuiltinType::LocalizedText:
            return true;
        default:
            return false;
    }
}

bool parseArrayLiteral(const std::string& literal, BuiltinType elemType, UAArray& out, std::string& err) {
    out.clear();
    if (!isArrayElementTypeSupported(elemType)) {
        err = std::string("unsupported array element type: ") + builtinTypeName(elemType);
        return false;
    }
    std::string s = trim(literal);
    if (!s.empty() && s.front() == '[') s.erase(0, 1);
    if (!s.empty() && s.back() == ']')  s.pop_back();
    if (trim(s).empty()) { err = "empty array literal"; return false; }

    size_t start = 0;
    for (;;) {
        const size_t comma = s.find(',', start);
        std::string item = trim(s.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (elemType == BuiltinType::String && item.size() >= 2 && item.front() == '"' && item.back() == '"')
            item = item.substr(1, item.size() - 2);
        UAScalar v;
        std::string e;
        if (!convertLiteral(item, elemType, v, e)) {
            err = "array element " + std::to_string(out.size()) + ": " + e;
            out.clear();
            return false;
        }
        out.push_back(std::move(v));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return true;
}
