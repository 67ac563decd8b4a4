#include "SecureChannelProvisioner.h"
#include "CertificateGenerator.h"
#include "Logger.h"
#include "OpenSslUtil.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace {
constexpr const char* kTag = "Sec";
constexpr const char* kPolicyPrefix = "http://opcfoundation.org/UA/SecurityPolicy#";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string hostName() {
#if defined(_WIN32)
    const char* h = std::getenv("COMPUTERNAME");
    return h ? h : "localhost";
#else
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || !buf[0]) return "localhost";
    return buf;
#endif
}

bool isUrlLike(const std::string& s) {
    const std::string l = lower(s);
    return l.rfind("urn:", 0) == 0 || l.rfind("http:", 0) == 0 || l.rfind("https:", 0) == 0;
}

bool fileExists(const std::string& p) {
    std::error_code ec;
    return !p.empty() && std::filesystem::exists(p, ec);
}
} // namespace

std::string SecureChannelProvisioner::defaultApplicationUri() {
    return "urn:" + hostName() + ":uabridge";
}

bool SecureChannelProvisioner::normalizeSecurityPolicy(const std::string& in, std::string& uriOut, std::string& err) {
    static const char* kKnown[] = { "None", "Basic128Rsa15", "Basic256", "Basic256Sha256",
                                    "Aes128_Sha256_RsaOaep", "Aes256_Sha256_RsaPss" };
    const std::string s = trim(in);
    if (s.empty() || lower(s) == "auto") { uriOut.clear(); return true; }
    if (s.find("://") != std::string::npos) { uriOut = s; return true; }
    for (const char* k : kKnown) {
        if (lower(s) == lower(k)) { uriOut = std::string(kPolicyPrefix) + k; return true; }
    }
    err = "unknown security policy '" + in + "'";
    return false;
}

bool SecureChannelProvisioner::parseSecurityMode(const std::string& in, SecurityMode& out, std::string& err) {
    const std::string s = lower(trim(in));
    if (s.empty() || s == "auto" || s == "none")               { out = SecurityMode::None; return true; }
    if (s == "sign")                                           { out = SecurityMode::Sign; return true; }
    if (s == "signandencrypt" || s == "sign_and_encrypt" || s == "sign&encrypt") {
        out = SecurityMode::SignAndEncrypt; return true;
    }
    err = "unknown security mode '" + in + "'";
    return false;
}

bool SecureChannelProvisioner::parseIdentity(const std::string& authMode, IdentityKind& out, std::string& err) {
    const std::string s = lower(trim(authMode));
    if (s.empty() || s == "anonymous" || s == "none") { out = IdentityKind::Anonymous; return true; }
    if (s == "username" || s == "user")               { out = IdentityKind::Username;  return true; }
    if (s == "certificate" || s == "cert") {
        err = "certificate user identity is not supported";
        return false;
    }
    err = "unknown auth mode '" + authMode + "'";
    return false;
}

bool SecureChannelProvisioner::ensureCertificates(ClientConfig& cfg, std::string& err) const {
    const bool haveCert = !cfg.certFile.empty();
    const bool haveKey  = !cfg.keyFile.empty();
    if (haveCert != haveKey) {
        err = "cert_file and key_file must be set together";
        return false;
    }

    if (!haveCert || !fileExists(cfg.certFile) || !fileExists(cfg.keyFile)) {
        if (!cfg.autoGenerateCert) {
            err = haveCert ? "certificate or key file not found: " + cfg.certFile + ", " + cfg.keyFile
                           : "secure mode requires cert_file and key_file";
            return false;
        }
        CertificateGenerator gen(opt_.certificateDir.empty() ? CertificateGenerator::defaultDirectory()
                                                             : opt_.certificateDir);
        CertificateRequest req;
        req.applicationUri = cfg.applicationUri.empty() ? defaultApplicationUri() : cfg.applicationUri;
        req.dnsNames.push_back(hostName());
        CertificateArtifacts art;
        if (!gen.issueClientCertificate(req, "client", art, err)) return false;
        cfg.certFile = art.derPath;
        cfg.keyFile  = art.keyPath;
        if (cfg.applicationUri.empty()) cfg.applicationUri = req.applicationUri;
        logLine(LogLevel::Info, kTag) << "auto-generated client certificate " << cfg.certFile;
    }
    return validateCertificateFiles(cfg.certFile, cfg.keyFile, err);
}

bool SecureChannelProvisioner::provision(const ClientConfig& cfgIn, TransportOptions& out, std::string& err) const {
    ClientConfig cfg = cfgIn;
    out = TransportOptions{};

    out.endpointUrl = trim(cfg.endpointUrl);
    if (out.endpointUrl.rfind("opc.tcp://", 0) != 0) {
        err = "endpoint URL must start with opc.tcp:// (got '" + cfg.endpointUrl + "')";
        return false;
    }

    if (!parseSecurityMode(cfg.securityMode, out.securityMode, err)) return false;
    std::string policyUri;
    if (!normalizeSecurityPolicy(cfg.securityPolicy, policyUri, err)) return false;

    const bool policyIsNone = policyUri.empty() || policyUri == kPolicyNoneUri;
    if (out.securityMode == SecurityMode::None) {
        if (!policyIsNone) {
            err = "security mode None requires security policy None (got " + policyUri + ")";
            return false;
        }
        policyUri = kPolicyNoneUri;
    } else if (policyIsNone) {
        err = std::string("security mode ") + securityModeName(out.securityMode) +
              " requires a security policy other than None";
        return false;
    }
    out.securityPolicyUri = policyUri;

    if (!parseIdentity(cfg.authMode, out.identity, err)) return false;
    if (out.identity == IdentityKind::Username) {
        if (cfg.username.empty()) { err = "auth mode Username requires a username"; return false; }
        out.username = cfg.username;
        out.password = cfg.password;
    }
    out.userTokenPolicyId = cfg.userTokenPolicyId;

    if (out.securityMode != SecurityMode::None) {
        if (!ensureCertificates(cfg, err)) return false;

        std::vector<uint8_t> keyBytes, certBytes;
        if (!readFileBytes(cfg.keyFile, keyBytes, err)) return false;
        if (!readFileBytes(cfg.certFile, certBytes, err)) return false;
        EvpPkeyPtr key = parsePrivateKey(keyBytes, err);
        if (!key) return false;
        auto certs = parseCertificates(certBytes, err);
        if (certs.empty()) return false;

        X509* chosen = nullptr;
        for (auto& c : certs) {
            if (certificateMatchesKey(c.get(), key.get())) { chosen = c.get(); break; }
        }
        if (!chosen) {
            err = "certificate public key does not match private key";
            return false;
        }
        if (!checkValidityWindow(chosen, err)) return false;

        const std::string certUri = certificateUri(chosen);
        if (cfg.applicationUri.empty()) {
            if (!certUri.empty()) {
                cfg.applicationUri = certUri;
            } else {
                const std::string cn = certificateCommonName(chosen);
                if (isUrlLike(cn)) cfg.applicationUri = cn;
            }
        } else if (!certUri.empty() && certUri != cfg.applicationUri) {
            logLine(LogLevel::Warn, kTag) << "application URI " << cfg.applicationUri
                                          << " differs from certificate URI " << certUri;
        }
        out.certificateDer = certificateToDer(chosen);
        out.privateKeyDer  = privateKeyToDer(key.get());
        if (out.certificateDer.empty() || out.privateKeyDer.empty()) {
            err = buildOpenSslErrorMessage("DER encoding of certificate/key");
            return false;
        }
    } else if (!cfg.certFile.empty()) {
        logLine(LogLevel::Debug, kTag) << "security mode None, ignoring " << cfg.certFile;
    }

    out.applicationUri = cfg.applicationUri.empty() ? defaultApplicationUri() : cfg.applicationUri;
    out.productUri     = cfg.productUri;
    out.sessionName    = cfg.sessionName.empty() ? out.applicationUri : cfg.sessionName;

    const double sessionSec = cfg.sessionTimeoutSec > 0 ? cfg.sessionTimeoutSec : 3600.0;
    const double connectSec = cfg.connectTimeoutSec > 0 ? cfg.connectTimeoutSec : 10.0;
    out.sessionTimeout = std::chrono::milliseconds(static_cast<long long>(sessionSec * 1000.0));
    out.connectTimeout = std::chrono::milliseconds(static_cast<long long>(connectSec * 1000.0));

    logLine(LogLevel::Info, kTag) << "transport: " << out.endpointUrl << " policy=" << out.securityPolicyUri
                                  << " mode=" << securityModeName(out.securityMode)
                                  << " identity=" << (out.identity == IdentityKind::Username ? "Username" : "Anonymous")
                                  << " appUri=" << out.applicationUri;
    return true;
}
