#include "StatusCodes.h"
#include <cstdio>

namespace {
struct NameEntry { uint32_t code; const char* name; };

// Nur der Statusteil (obere 16 Bit) ist relevant; Info-Bits werden vor dem Lookup maskiert.
constexpr NameEntry kNames[] = {
    { UaStatus::Good,                     "Good" },
    { UaStatus::Uncertain,                "Uncertain" },
    { UaStatus::Bad,                      "Bad" },
    { UaStatus::BadUnexpectedError,       "BadUnexpectedError" },
    { UaStatus::BadInternalError,         "BadInternalError" },
    { UaStatus::BadOutOfMemory,           "BadOutOfMemory" },
    { UaStatus::BadCommunicationError,    "BadCommunicationError" },
    { UaStatus::BadEncodingError,         "BadEncodingError" },
    { UaStatus::BadDecodingError,         "BadDecodingError" },
    { UaStatus::BadTimeout,               "BadTimeout" },
    { UaStatus::BadServiceUnsupported,    "BadServiceUnsupported" },
    { UaStatus::BadShutdown,              "BadShutdown" },
    { UaStatus::BadServerNotConnected,    "BadServerNotConnected" },
    { UaStatus::BadNothingToDo,           "BadNothingToDo" },
    { UaStatus::BadTooManyOperations,     "BadTooManyOperations" },
    { UaStatus::BadDataTypeIdUnknown,     "BadDataTypeIdUnknown" },
    { UaStatus::BadCertificateInvalid,    "BadCertificateInvalid" },
    { UaStatus::BadSecurityChecksFailed,  "BadSecurityChecksFailed" },
    { UaStatus::BadCertificateTimeInvalid,"BadCertificateTimeInvalid" },
    { UaStatus::BadCertificateUntrusted,  "BadCertificateUntrusted" },
    { UaStatus::BadUserAccessDenied,      "BadUserAccessDenied" },
    { UaStatus::BadIdentityTokenInvalid,  "BadIdentityTokenInvalid" },
    { UaStatus::BadIdentityTokenRejected, "BadIdentityTokenRejected" },
    { UaStatus::BadSessionIdInvalid,      "BadSessionIdInvalid" },
    { UaStatus::BadSessionClosed,         "BadSessionClosed" },
    { UaStatus::BadSessionNotActivated,   "BadSessionNotActivated" },
    { UaStatus::BadSubscriptionIdInvalid, "BadSubscriptionIdInvalid" },
    { UaStatus::BadWaitingForInitialData, "BadWaitingForInitialData" },
    { UaStatus::BadNodeIdInvalid,         "BadNodeIdInvalid" },
    { UaStatus::BadNodeIdUnknown,         "BadNodeIdUnknown" },
    { UaStatus::BadAttributeIdInvalid,    "BadAttributeIdInvalid" },
    { UaStatus::BadIndexRangeInvalid,     "BadIndexRangeInvalid" },
    { UaStatus::BadNotReadable,           "BadNotReadable" },
    { UaStatus::BadNotWritable,           "BadNotWritable" },
    { UaStatus::BadOutOfRange,            "BadOutOfRange" },
    { UaStatus::BadNotSupported,          "BadNotSupported" },
    { UaStatus::BadNotFound,              "BadNotFound" },
    { UaStatus::BadMonitoredItemIdInvalid,"BadMonitoredItemIdInvalid" },
    { UaStatus::BadSecurityPolicyRejected,"BadSecurityPolicyRejected" },
    { UaStatus::BadTypeMismatch,          "BadTypeMismatch" },
    { UaStatus::BadNoSubscription,        "BadNoSubscription" },
    { UaStatus::BadTcpEndpointUrlInvalid, "BadTcpEndpointUrlInvalid" },
    { UaStatus::BadConnectionRejected,    "BadConnectionRejected" },
    { UaStatus::BadDisconnect,            "BadDisconnect" },
    { UaStatus::BadConnectionClosed,      "BadConnectionClosed" },
    { UaStatus::BadInvalidState,          "BadInvalidState" },
    { UaStatus::UncertainLastUsableValue, "UncertainLastUsableValue" },
    { UaStatus::UncertainInitialValue,    "UncertainInitialValue" },
    { UaStatus::UncertainSensorNotAccurate, "UncertainSensorNotAccurate" },
    { UaStatus::GoodOverload,             "GoodOverload" },
    { UaStatus::GoodClamped,              "GoodClamped" },
};

std::string hex32(uint32_t v) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08X", v);
    return buf;
}
} // namespace

const char* UaStatus::name(uint32_t code) {
    const uint32_t key = code & 0xFFFF0000u;
    for (const auto& e : kNames)
        if (e.code == key) return e.name;
    return nullptr;
}

DecodedStatus decodeStatusCode(uint32_t raw) {
    DecodedStatus d;
    switch ((raw >> 30) & 0x3u) {
        case 0:  d.severity = "Good"; break;
        case 1:  d.severity = "Uncertain"; break;
        case 2:  d.severity = "Bad"; break;
        default: d.severity = "Unknown"; break;
    }
    d.subCode          = static_cast<uint16_t>((raw >> 16) & 0x3FFFu);
    d.structureChanged = (raw & 0x8000u) != 0;
    d.semanticsChanged = (raw & 0x4000u) != 0;
    d.infoBits         = static_cast<uint16_t>(raw & 0x3FFFu);
    d.rawCode          = hex32(raw);
    const char* n = UaStatus::name(raw);
    d.symbolicName = n ? n : d.rawCode;
    return d;
}

std::string statusToString(uint32_t raw) {
    const char* n = UaStatus::name(raw);
    return std::string(n ? n : "Unknown") + " (" + hex32(raw) + ")";
}
