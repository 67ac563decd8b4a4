// StatusCodes – OPC-UA-Statuscodes ohne Abhängigkeit zu open62541
//
// Die Kernlogik (Controller, WriteEngine, WatchManager) arbeitet mit den rohen
// 32-Bit-Codes; der Adapter (OpcUaSession) reicht die Codes des Stacks unverändert durch.
//
// decodeStatusCode(raw) zerlegt einen Code in
//   severity          : Bits 30-31 -> "Good" / "Uncertain" / "Bad" / "Unknown"
//   subCode           : (raw >> 16) & 0x3FFF
//   structureChanged  : Bit 15
//   semanticsChanged  : Bit 14
//   infoBits          : raw & 0x3FFF
//   rawCode           : "0x%08X"
//   symbolicName      : Name aus der Tabelle (z. B. "BadTypeMismatch"), sonst rawCode
#pragma once
#include <cstdint>
#include <string>

namespace UaStatus {
    constexpr uint32_t Good                    = 0x00000000;
    constexpr uint32_t Uncertain               = 0x40000000;
    constexpr uint32_t Bad                     = 0x80000000;
    constexpr uint32_t BadUnexpectedError      = 0x80010000;
    constexpr uint32_t BadInternalError        = 0x80020000;
    constexpr uint32_t BadOutOfMemory          = 0x80030000;
    constexpr uint32_t BadCommunicationError   = 0x80050000;
    constexpr uint32_t BadEncodingError        = 0x80060000;
    constexpr uint32_t BadDecodingError        = 0x80070000;
    constexpr uint32_t BadTimeout              = 0x800A0000;
    constexpr uint32_t BadServiceUnsupported   = 0x800B0000;
    constexpr uint32_t BadShutdown             = 0x800C0000;
    constexpr uint32_t BadServerNotConnected   = 0x800D0000;
    constexpr uint32_t BadNothingToDo          = 0x800F0000;
    constexpr uint32_t BadTooManyOperations    = 0x80100000;
    constexpr uint32_t BadDataTypeIdUnknown    = 0x80110000;
    constexpr uint32_t BadCertificateInvalid   = 0x80120000;
    constexpr uint32_t BadSecurityChecksFailed = 0x80130000;
    constexpr uint32_t BadCertificateTimeInvalid = 0x80140000;
    constexpr uint32_t BadCertificateUntrusted = 0x801A0000;
    constexpr uint32_t BadUserAccessDenied     = 0x801F0000;
    constexpr uint32_t BadIdentityTokenInvalid = 0x80200000;
    constexpr uint32_t BadIdentityTokenRejected = 0x80210000;
    constexpr uint32_t BadSessionIdInvalid     = 0x80250000;
    constexpr uint32_t BadSessionClosed        = 0x80260000;
    constexpr uint32_t BadSessionNotActivated  = 0x80270000;
    constexpr uint32_t BadSubscriptionIdInvalid = 0x80280000;
    constexpr uint32_t BadNodeIdInvalid        = 0x80330000;
    constexpr uint32_t BadNodeIdUnknown        = 0x80340000;
    constexpr uint32_t BadAttributeIdInvalid   = 0x80350000;
    constexpr uint32_t BadIndexRangeInvalid    = 0x80360000;
    constexpr uint32_t BadNotReadable          = 0x803A0000;
    constexpr uint32_t BadNotWritable          = 0x803B0000;
    constexpr uint32_t BadOutOfRange           = 0x803C0000;
    constexpr uint32_t BadNotSupported         = 0x803D0000;
    constexpr uint32_t BadNotFound             = 0x803E0000;
    constexpr uint32_t BadMonitoredItemIdInvalid = 0x80420000;
    constexpr uint32_t BadNoSubscription       = 0x80790000;
    constexpr uint32_t BadTypeMismatch         = 0x80740000;
    constexpr uint32_t BadSecurityPolicyRejected = 0x80550000;
    constexpr uint32_t BadTcpEndpointUrlInvalid = 0x80830000;
    constexpr uint32_t BadConnectionRejected   = 0x80AC0000;
    constexpr uint32_t BadDisconnect           = 0x80AD0000;
    constexpr uint32_t BadConnectionClosed     = 0x80AE0000;
    constexpr uint32_t BadInvalidState         = 0x80AF0000;
    constexpr uint32_t BadWaitingForInitialData = 0x80320000;
    constexpr uint32_t UncertainLastUsableValue = 0x40900000;
    constexpr uint32_t UncertainInitialValue   = 0x40920000;
    constexpr uint32_t UncertainSensorNotAccurate = 0x40930000;
    constexpr uint32_t GoodOverload            = 0x002F0000;
    constexpr uint32_t GoodClamped             = 0x00300000;

    inline bool isGood(uint32_t s) { return (s & 0xC0000000u) == 0; }
    inline bool isBad(uint32_t s)  { return (s & 0x80000000u) != 0; }

    // Symbolischer Name ("BadTypeMismatch"); nullptr wenn unbekannt
    const char* name(uint32_t code);
}

struct DecodedStatus {
    std::string severity;       // Good | Uncertain | Bad | Unknown
    std::string symbolicName;
    uint16_t    subCode = 0;
    bool        structureChanged = false;
    bool        semanticsChanged = false;
    uint16_t    infoBits = 0;
    std::string rawCode;        // "0x%08X"
};

DecodedStatus decodeStatusCode(uint32_t raw);

// "BadTypeMismatch (0x80740000)"
std::string statusToString(uint32_t raw);
