// SecureChannelProvisioner – ClientConfig -> TransportOptions
//
// provision(cfg, out, err):
//   1. Endpoint, Security-Mode und -Policy normalisieren; unvereinbare Kombinationen
//      ablehnen (Policy None <-> Mode None).
//   2. Identität: Anonymous oder Username; Certificate-Identität wird abgelehnt.
//   3. Bei Sign/SignAndEncrypt: Zertifikat + Schlüssel laden (ggf. vorher automatisch
//      erzeugen, wenn auto_generate_cert gesetzt ist), passendes Zertifikat aus der Kette
//      wählen, Zeitfenster prüfen.
//   4. Application-URI aus SAN-URI bzw. URL-artigem CN ableiten, wenn nicht gesetzt.
//      Session-Name fällt auf die Application-URI zurück.
#pragma once
#include "ClientConfig.h"
#include "TransportOptions.h"
#include <string>

class SecureChannelProvisioner {
public:
    struct Options {
        std::string certificateDir;   // leer -> CertificateGenerator::defaultDirectory()
    };

    SecureChannelProvisioner() = default;
    explicit SecureChannelProvisioner(Options o) : opt_(std::move(o)) {}

    bool provision(const ClientConfig& cfg, TransportOptions& out, std::string& err) const;

    // Kurzname oder URI -> URI ("" und "auto" -> "", Aufrufer entscheidet)
    static bool normalizeSecurityPolicy(const std::string& in, std::string& uriOut, std::string& err);
    static bool parseSecurityMode(const std::string& in, SecurityMode& out, std::string& err);
    static bool parseIdentity(const std::string& authMode, IdentityKind& out, std::string& err);

    // "urn:<hostname>:uabridge"
    static std::string defaultApplicationUri();

    // Stellt sicher, dass cfg.certFile/keyFile auf gültiges Material zeigen; erzeugt es
    // nur bei cfg.autoGenerateCert. Aktualisiert cfg bei Neuerzeugung.
    bool ensureCertificates(ClientConfig& cfg, std::string& err) const;

    static constexpr const char* kPolicyNoneUri = "http://opcfoundation.org/UA/SecurityPolicy#None";

private:
    Options opt_;
};
