// TransportOptions – fertig aufbereitete Optionen zum Öffnen einer Session
//
// Wird vom SecureChannelProvisioner aus der deklarativen ClientConfig erzeugt und
// unverändert an IProtocolConnector::openSession übergeben. Zertifikat und Schlüssel
// liegen bereits als DER-Bytes vor (passendes Zertifikat aus der Kette ausgewählt).
#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

enum class SecurityMode { None = 1, Sign = 2, SignAndEncrypt = 3 };
enum class IdentityKind { Anonymous, Username };

inline const char* securityModeName(SecurityMode m) {
    switch (m) {
        case SecurityMode::None:           return "None";
        case SecurityMode::Sign:           return "Sign";
        case SecurityMode::SignAndEncrypt: return "SignAndEncrypt";
    }
    return "?";
}

struct TransportOptions {
    std::string  endpointUrl;
    std::string  securityPolicyUri;           // volle URI, z. B. ...#Basic256Sha256
    SecurityMode securityMode = SecurityMode::None;

    IdentityKind identity = IdentityKind::Anonymous;
    std::string  username;
    std::string  password;
    std::string  userTokenPolicyId;           // optional

    std::vector<uint8_t> certificateDer;      // leer bei SecurityMode::None
    std::vector<uint8_t> privateKeyDer;

    std::string  applicationUri;
    std::string  productUri;
    std::string  sessionName;

    std::chrono::milliseconds sessionTimeout{60 * 60 * 1000};
    std::chrono::milliseconds connectTimeout{10 * 1000};
};
