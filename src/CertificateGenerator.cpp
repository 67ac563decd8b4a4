// CertificateGenerator
// - RSA-Schlüssel und X.509-Zertifikate über die OpenSSL-EVP/X509-API.
// - Interne Schritte werfen std::runtime_error (throwOpenSslError); die öffentlichen
//   Methoden fangen das und liefern false + Fehlertext.
#include "CertificateGenerator.h"
#include "Logger.h"
#include "OpenSslUtil.h"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509v3.h>

namespace fs = std::filesystem;

namespace {
constexpr const char* kTag = "Cert";

EvpPkeyPtr generateRsaKey(int bits) {
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx) throwOpenSslError("EVP_PKEY_CTX_new_id");
    if (EVP_PKEY_keygen_init(ctx.get()) != 1) throwOpenSslError("EVP_PKEY_keygen_init");
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) != 1) throwOpenSslError("EVP_PKEY_CTX_set_rsa_keygen_bits");
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) throwOpenSslError("EVP_PKEY_keygen");
    return EvpPkeyPtr(raw);
}

void setRandomSerial(X509* cert) {
    unsigned char buf[16];
    if (RAND_bytes(buf, sizeof(buf)) != 1) throwOpenSslError("RAND_bytes");
    buf[0] &= 0x7F; // positiv halten
    BignumPtr bn(BN_bin2bn(buf, sizeof(buf), nullptr));
    if (!bn) throwOpenSslError("BN_bin2bn");
    if (!BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert))) throwOpenSslError("BN_to_ASN1_INTEGER");
}

void addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    if (value.empty()) return;
    if (X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(value.c_str()), -1, -1, 0) != 1)
        throwOpenSslError("X509_NAME_add_entry_by_txt");
}

void addExtension(X509* cert, X509* issuer, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
    if (!ext) throwOpenSslError("X509V3_EXT_conf_nid");
    const int rc = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (rc != 1) throwOpenSslError("X509_add_ext");
}

std::string subjectAltName(const CertificateRequest& req) {
    std::string san;
    if (!req.applicationUri.empty()) san = "URI:" + req.applicationUri;
    for (const auto& dns : req.dnsNames) {
        if (dns.empty()) continue;
        if (!san.empty()) san += ",";
        san += "DNS:" + dns;
    }
    return san;
}

template<class WriteFn>
std::string toPem(WriteFn fn, const char* context) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) throwOpenSslError("BIO_new");
    if (fn(bio.get()) != 1) throwOpenSslError(context);
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

std::string certToPem(X509* cert) {
    return toPem([&](BIO* b){ return PEM_write_bio_X509(b, cert); }, "PEM_write_bio_X509");
}

std::string keyToPkcs1Pem(EVP_PKEY* key) {
    return toPem([&](BIO* b){
        return PEM_write_bio_PrivateKey_traditional(b, key, nullptr, nullptr, 0, nullptr, nullptr);
    }, "PEM_write_bio_PrivateKey_traditional");
}

std::string keyToPkcs8Pem(EVP_PKEY* key) {
    return toPem([&](BIO* b){
        return PEM_write_bio_PKCS8PrivateKey(b, key, nullptr, nullptr, 0, nullptr, nullptr);
    }, "PEM_write_bio_PKCS8PrivateKey");
}

void writeOrThrow(const std::string& path, const std::string& data, bool privateFile) {
    std::string err;
    if (!writeFileBytes(path, data, privateFile, err)) throw std::runtime_error(err);
}

// issuer == nullptr -> selbstsigniert
X509Ptr buildCertificate(const CertificateRequest& req, EVP_PKEY* key,
                         X509* issuerCert, EVP_PKEY* issuerKey, bool isCa) {
    X509Ptr cert(X509_new());
    if (!cert) throwOpenSslError("X509_new");
    if (X509_set_version(cert.get(), 2) != 1) throwOpenSslError("X509_set_version");
    setRandomSerial(cert.get());

    // NotBefore = jetzt - 5 min
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -5 * 60);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(req.validityDays) * 24 * 60 * 60);

    X509_NAME* name = X509_get_subject_name(cert.get());
    addNameEntry(name, "CN", req.commonName);
    addNameEntry(name, "O", req.organization);
    if (X509_set_issuer_name(cert.get(), issuerCert ? X509_get_subject_name(issuerCert) : name) != 1)
        throwOpenSslError("X509_set_issuer_name");
    if (X509_set_pubkey(cert.get(), key) != 1) throwOpenSslError("X509_set_pubkey");

    X509* issuer = issuerCert ? issuerCert : cert.get();
    if (isCa) {
        addExtension(cert.get(), issuer, NID_basic_constraints, "critical,CA:TRUE,pathlen:0");
        addExtension(cert.get(), issuer, NID_key_usage, "critical,keyCertSign,cRLSign");
    } else {
        addExtension(cert.get(), issuer, NID_basic_constraints, "critical,CA:FALSE");
        addExtension(cert.get(), issuer, NID_key_usage,
                     "critical,digitalSignature,nonRepudiation,keyEncipherment,dataEncipherment");
        addExtension(cert.get(), issuer, NID_ext_key_usage, "clientAuth,serverAuth");
        const std::string san = subjectAltName(req);
        if (!san.empty()) addExtension(cert.get(), issuer, NID_subject_alt_name, san);
    }
    addExtension(cert.get(), issuer, NID_subject_key_identifier, "hash");
    addExtension(cert.get(), issuer, NID_authority_key_identifier, "keyid:always");

    if (X509_sign(cert.get(), issuerKey ? issuerKey : key, EVP_sha256()) <= 0)
        throwOpenSslError("X509_sign");
    return cert;
}

void writeArtifacts(const std::string& base, X509* cert, EVP_PKEY* key, CertificateArtifacts& out) {
    const auto der = certificateToDer(cert);
    out.derPath   = base + ".der";
    out.pemPath   = base + ".crt";
    out.keyPath   = base + ".key";
    out.pkcs8Path = base + ".pem";
    writeOrThrow(out.derPath, std::string(der.begin(), der.end()), false);
    writeOrThrow(out.pemPath, certToPem(cert), false);
    writeOrThrow(out.keyPath, keyToPkcs1Pem(key), true);
    writeOrThrow(out.pkcs8Path, keyToPkcs8Pem(key), true);
}

std::string bioToString(BIO* bio) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    return len > 0 ? std::string(data, static_cast<size_t>(len)) : std::string();
}

std::string nameToString(X509_NAME* name) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) return {};
    X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_ONELINE);
    return bioToString(bio.get());
}

std::string timeToString(const ASN1_TIME* t) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) return {};
    ASN1_TIME_print(bio.get(), t);
    return bioToString(bio.get());
}
} // namespace

CertificateGenerator::CertificateGenerator(std::string outDir) : dir_(std::move(outDir)) {}

std::string CertificateGenerator::defaultDirectory() {
    std::error_code ec;
    if (const char* home = std::getenv("HOME"); home && *home)
        return (fs::path(home) / "Documents" / "uabridge" / "certificates").string();
    if (const char* profile = std::getenv("USERPROFILE"); profile && *profile)
        return (fs::path(profile) / "Documents" / "uabridge" / "certificates").string();
    return (fs::temp_directory_path(ec) / "uabridge" / "certificates").string();
}

std::string CertificateGenerator::path(const std::string& file) const {
    return (fs::path(dir_) / file).string();
}

std::string CertificateGenerator::caCertPath() const { return path("ca.crt"); }
std::string CertificateGenerator::caKeyPath() const  { return path("ca.key"); }

bool CertificateGenerator::ensureLocalCA(std::string& err) {
    std::error_code ec;
    if (fs::exists(caCertPath(), ec) && fs::exists(caKeyPath(), ec)) {
        logLine(LogLevel::Debug, kTag) << "reusing local CA in " << dir_;
        return true;
    }
    try {
        fs::create_directories(dir_, ec);
        CertificateRequest req;
        req.commonName = "UaBridge Local CA";
        req.validityDays = 10 * 365;
        EvpPkeyPtr key = generateRsaKey(2048);
        X509Ptr cert = buildCertificate(req, key.get(), nullptr, nullptr, true);
        writeOrThrow(caCertPath(), certToPem(cert.get()), false);
        writeOrThrow(caKeyPath(), keyToPkcs1Pem(key.get()), true);
        logLine(LogLevel::Info, kTag) << "created local CA " << caCertPath();
        return true;
    } catch (const std::exception& e) {
        err = std::string("local CA: ") + e.what();
        return false;
    }
}

bool CertificateGenerator::issueClientCertificate(const CertificateRequest& req, const std::string& baseName,
                                                  CertificateArtifacts& out, std::string& err) {
    if (!ensureLocalCA(err)) return false;
    try {
        std::vector<uint8_t> caCertBytes, caKeyBytes;
        if (!readFileBytes(caCertPath(), caCertBytes, err) || !readFileBytes(caKeyPath(), caKeyBytes, err))
            return false;
        auto caCerts = parseCertificates(caCertBytes, err);
        if (caCerts.empty()) return false;
        EvpPkeyPtr caKey = parsePrivateKey(caKeyBytes, err);
        if (!caKey) return false;

        EvpPkeyPtr key = generateRsaKey(req.keyBits);
        X509Ptr cert = buildCertificate(req, key.get(), caCerts.front().get(), caKey.get(), false);
        writeArtifacts(path(baseName), cert.get(), key.get(), out);
        logLine(LogLevel::Info, kTag) << "issued CA-signed certificate " << out.derPath
                                      << " uri=" << req.applicationUri;
        return true;
    } catch (const std::exception& e) {
        err = std::string("client certificate: ") + e.what();
        return false;
    }
}

bool CertificateGenerator::issueSelfSigned(const CertificateRequest& req, const std::string& baseName,
                                           CertificateArtifacts& out, std::string& err) {
    try {
        std::error_code ec;
        fs::create_directories(dir_, ec);
        EvpPkeyPtr key = generateRsaKey(req.keyBits);
        X509Ptr cert = buildCertificate(req, key.get(), nullptr, nullptr, false);
        writeArtifacts(path(baseName), cert.get(), key.get(), out);
        logLine(LogLevel::Info, kTag) << "issued self-signed certificate " << out.derPath;
        return true;
    } catch (const std::exception& e) {
        err = std::string("self-signed certificate: ") + e.what();
        return false;
    }
}

bool CertificateGenerator::generateCsr(const CertificateRequest& req, const std::string& baseName,
                                       std::string& csrPathOut, std::string& keyPathOut, std::string& err) {
    try {
        EvpPkeyPtr key = generateRsaKey(req.keyBits);
        X509ReqPtr csr(X509_REQ_new());
        if (!csr) throwOpenSslError("X509_REQ_new");
        if (X509_REQ_set_version(csr.get(), 0) != 1) throwOpenSslError("X509_REQ_set_version");
        X509_NAME* name = X509_REQ_get_subject_name(csr.get());
        addNameEntry(name, "CN", req.commonName);
        addNameEntry(name, "O", req.organization);
        if (X509_REQ_set_pubkey(csr.get(), key.get()) != 1) throwOpenSslError("X509_REQ_set_pubkey");

        const std::string san = subjectAltName(req);
        if (!san.empty()) {
            X509V3_CTX ctx;
            X509V3_set_ctx_nodb(&ctx);
            X509V3_set_ctx(&ctx, nullptr, nullptr, csr.get(), nullptr, 0);
            STACK_OF(X509_EXTENSION)* exts = sk_X509_EXTENSION_new_null();
            X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name, san.c_str());
            if (!ext) { sk_X509_EXTENSION_free(exts); throwOpenSslError("X509V3_EXT_conf_nid"); }
            sk_X509_EXTENSION_push(exts, ext);
            const int rc = X509_REQ_add_extensions(csr.get(), exts);
            sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
            if (rc != 1) throwOpenSslError("X509_REQ_add_extensions");
        }
        if (X509_REQ_sign(csr.get(), key.get(), EVP_sha256()) <= 0) throwOpenSslError("X509_REQ_sign");

        csrPathOut = path(baseName + ".csr");
        keyPathOut = path(baseName + ".key");
        writeOrThrow(csrPathOut,
                     toPem([&](BIO* b){ return PEM_write_bio_X509_REQ(b, csr.get()); }, "PEM_write_bio_X509_REQ"),
                     false);
        writeOrThrow(keyPathOut, keyToPkcs1Pem(key.get()), true);
        logLine(LogLevel::Info, kTag) << "wrote CSR " << csrPathOut;
        return true;
    } catch (const std::exception& e) {
        err = std::string("CSR: ") + e.what();
        return false;
    }
}

bool validateCertificateFiles(const std::string& certPath, const std::string& keyPath, std::string& err) {
    std::vector<uint8_t> certBytes, keyBytes;
    if (!readFileBytes(certPath, certBytes, err)) return false;
    if (!readFileBytes(keyPath, keyBytes, err)) return false;

    auto certs = parseCertificates(certBytes, err);
    if (certs.empty()) return false;
    EvpPkeyPtr key = parsePrivateKey(keyBytes, err);
    if (!key) return false;

    for (auto& c : certs) {
        if (!certificateMatchesKey(c.get(), key.get())) continue;
        return checkValidityWindow(c.get(), err);
    }
    err = "certificate public key does not match private key";
    return false;
}

bool readCertificateInfo(const std::string& certPath, CertificateInfo& out, std::string& err) {
    std::vector<uint8_t> bytes;
    if (!readFileBytes(certPath, bytes, err)) return false;
    auto certs = parseCertificates(bytes, err);
    if (certs.empty()) return false;
    X509* cert = certs.front().get();

    out = CertificateInfo{};
    out.subject   = nameToString(X509_get_subject_name(cert));
    out.issuer    = nameToString(X509_get_issuer_name(cert));
    out.notBefore = timeToString(X509_get0_notBefore(cert));
    out.notAfter  = timeToString(X509_get0_notAfter(cert));
    out.isCa      = X509_check_ca(cert) > 0;

    if (BignumPtr bn(ASN1_INTEGER_to_BN(X509_get_serialNumber(cert), nullptr)); bn) {
        char* hex = BN_bn2hex(bn.get());
        if (hex) { out.serialHex = hex; OPENSSL_free(hex); }
    }

    auto* names = static_cast<GENERAL_NAMES*>(X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    if (names) {
        for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i) {
            const GENERAL_NAME* gn = sk_GENERAL_NAME_value(names, i);
            if (gn->type != GEN_DNS && gn->type != GEN_URI) continue;
            const ASN1_IA5STRING* s = gn->type == GEN_DNS ? gn->d.dNSName : gn->d.uniformResourceIdentifier;
            std::string v(reinterpret_cast<const char*>(ASN1_STRING_get0_data(s)),
                          static_cast<size_t>(ASN1_STRING_length(s)));
            (gn->type == GEN_DNS ? out.dnsNames : out.uris).push_back(std::move(v));
        }
        GENERAL_NAMES_free(names);
    }
    ERR_clear_error();
    return true;
}
