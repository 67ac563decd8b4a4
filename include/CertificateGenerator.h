// CertificateGenerator – lokale CA und Client-Zertifikate für OPC UA
//
// Verzeichnislayout (outDir):
//   ca.crt / ca.key                  : lokale CA (einmal erzeugt, danach wiederverwendet)
//   <base>.der / <base>.crt          : Zertifikat als DER und PEM
//   <base>.key / <base>.pem          : Schlüssel als PKCS#1-PEM und PKCS#8-PEM (0600)
//   <base>.csr                       : Certificate Signing Request (generateCsr)
//
// Client-Zertifikate tragen die Application-URI als SAN-URI (muss zur
// ApplicationDescription der Session passen).
#pragma once
#include <string>
#include <vector>

struct CertificateRequest {
    std::string commonName = "UaBridge Client";
    std::string organization = "UaBridge";
    std::string applicationUri;
    std::vector<std::string> dnsNames;
    int validityDays = 365;
    int keyBits = 2048;
};

struct CertificateArtifacts {
    std::string derPath;
    std::string pemPath;
    std::string keyPath;     // PKCS#1
    std::string pkcs8Path;
};

struct CertificateInfo {
    std::string subject;
    std::string issuer;
    std::string serialHex;
    std::string notBefore;
    std::string notAfter;
    std::vector<std::string> dnsNames;
    std::vector<std::string> uris;
    bool isCa = false;
};

class CertificateGenerator {
public:
    explicit CertificateGenerator(std::string outDir);

    // ~/Documents/uabridge/certificates (Fallback: <tmp>/uabridge/certificates)
    static std::string defaultDirectory();

    const std::string& directory() const { return dir_; }
    std::string caCertPath() const;
    std::string caKeyPath() const;

    // Legt ca.crt/ca.key an, falls sie fehlen. Vorhandene CA wird nur geladen.
    bool ensureLocalCA(std::string& err);

    bool issueClientCertificate(const CertificateRequest& req, const std::string& baseName,
                                CertificateArtifacts& out, std::string& err);

    bool issueSelfSigned(const CertificateRequest& req, const std::string& baseName,
                         CertificateArtifacts& out, std::string& err);

    bool generateCsr(const CertificateRequest& req, const std::string& baseName,
                     std::string& csrPathOut, std::string& keyPathOut, std::string& err);

private:
    std::string path(const std::string& file) const;

    std::string dir_;
};

// Zertifikat (PEM/DER, ggf. Kette) und Schlüssel prüfen: Zeitfenster + Schlüsselpaar
bool validateCertificateFiles(const std::string& certPath, const std::string& keyPath, std::string& err);

bool readCertificateInfo(const std::string& certPath, CertificateInfo& out, std::string& err);
