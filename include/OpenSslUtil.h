// OpenSslUtil – gemeinsame OpenSSL-Helfer für Zertifikate und Schlüssel
//
//  - RAII-Handles (unique_ptr mit OpenSslDeleter) für X509, EVP_PKEY, BIO, ...
//  - buildOpenSslErrorMessage : Kontext + Text des ältesten Eintrags der Fehler-Queue
//  - parsePrivateKey          : PEM oder DER, PKCS#1 oder PKCS#8; verschlüsselte
//                               Schlüssel und Nicht-RSA-Schlüssel werden abgelehnt
//  - parseCertificates        : alle Zertifikate einer PEM-Kette bzw. DER-Datei
//  - certificateUri / certificateCommonName : SAN-URI bzw. CN des Subjects
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

class OpenSslDeleter {
public:
    void operator()(X509* p) const noexcept { X509_free(p); }
    void operator()(X509_REQ* p) const noexcept { X509_REQ_free(p); }
    void operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); }
    void operator()(EVP_PKEY_CTX* p) const noexcept { EVP_PKEY_CTX_free(p); }
    void operator()(BIO* p) const noexcept { BIO_free_all(p); }
    void operator()(BIGNUM* p) const noexcept { BN_free(p); }
};

using X509Ptr    = std::unique_ptr<X509, OpenSslDeleter>;
using X509ReqPtr = std::unique_ptr<X509_REQ, OpenSslDeleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, OpenSslDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, OpenSslDeleter>;
using BioPtr     = std::unique_ptr<BIO, OpenSslDeleter>;
using BignumPtr  = std::unique_ptr<BIGNUM, OpenSslDeleter>;

std::string buildOpenSslErrorMessage(const char* context);
[[noreturn]] void throwOpenSslError(const char* context);

bool readFileBytes(const std::string& path, std::vector<uint8_t>& out, std::string& err);
// privateFile: Rechte auf 0600 setzen (Schlüsselmaterial)
bool writeFileBytes(const std::string& path, const std::string& data, bool privateFile, std::string& err);

bool isPem(const std::vector<uint8_t>& data);

EvpPkeyPtr parsePrivateKey(const std::vector<uint8_t>& data, std::string& err);
std::vector<X509Ptr> parseCertificates(const std::vector<uint8_t>& data, std::string& err);

bool certificateMatchesKey(X509* cert, EVP_PKEY* key);
std::string certificateUri(X509* cert);
std::string certificateCommonName(X509* cert);

std::vector<uint8_t> certificateToDer(X509* cert);
std::vector<uint8_t> privateKeyToDer(EVP_PKEY* key);

// Zeitfenster prüfen: false + err bei "not yet valid" / "expired"
bool checkValidityWindow(X509* cert, std::string& err);
