#include "OpenSslUtil.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

std::string buildOpenSslErrorMessage(const char* context) {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return std::string(context) + ": unknown OpenSSL error";
    }
    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    ERR_clear_error();
    std::string message(context);
    message.append(": ");
    message.append(buf);
    return message;
}

void throwOpenSslError(const char* context) {
    throw std::runtime_error(buildOpenSslErrorMessage(context));
}

bool readFileBytes(const std::string& path, std::vector<uint8_t>& out, std::string& err) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) { err = "cannot open " + path; return false; }
    const std::streamsize len = f.tellg();
    if (len <= 0) { err = "file is empty: " + path; return false; }
    f.seekg(0, std::ios::beg);
    out.resize(static_cast<size_t>(len));
    if (!f.read(reinterpret_cast<char*>(out.data()), len)) {
        err = "cannot read " + path;
        out.clear();
        return false;
    }
    return true;
}

bool writeFileBytes(const std::string& path, const std::string& data, bool privateFile, std::string& err) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (auto parent = fs::path(path).parent_path(); !parent.empty())
        fs::create_directories(parent, ec);

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) { err = "cannot create " + path; return false; }
    f.write(data.data(), static_cast<std::streamsize>(data.size()));
    f.close();
    if (!f) { err = "cannot write " + path; return false; }

    if (privateFile) {
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) { err = "cannot restrict permissions of " + path + ": " + ec.message(); return false; }
    }
    return true;
}

bool isPem(const std::vector<uint8_t>& data) {
    static const std::string marker = "-----BEGIN";
    return std::search(data.begin(), data.end(), marker.begin(), marker.end()) != data.end();
}

namespace {
// Kein Passwort-Prompt: verschlüsselte PEM-Schlüssel schlagen damit sofort fehl
int noPassword(char*, int, int, void*) { return 0; }
}

EvpPkeyPtr parsePrivateKey(const std::vector<uint8_t>& data, std::string& err) {
    if (data.empty()) { err = "private key is empty"; return nullptr; }

    EvpPkeyPtr key;
    if (isPem(data)) {
        const std::string text(data.begin(), data.end());
        if (text.find("ENCRYPTED") != std::string::npos) {
            err = "encrypted private keys are not supported";
            return nullptr;
        }
        BioPtr bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
        if (!bio) { err = buildOpenSslErrorMessage("BIO_new_mem_buf"); return nullptr; }
        key.reset(PEM_read_bio_PrivateKey(bio.get(), nullptr, &noPassword, nullptr));
        if (!key) { err = buildOpenSslErrorMessage("PEM_read_bio_PrivateKey"); return nullptr; }
    } else {
        const unsigned char* p = data.data();
        key.reset(d2i_AutoPrivateKey(nullptr, &p, static_cast<long>(data.size())));
        if (!key) {
            err = buildOpenSslErrorMessage("d2i_AutoPrivateKey (encrypted or malformed DER key)");
            return nullptr;
        }
    }
    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
        err = "private key is not an RSA key";
        return nullptr;
    }
    return key;
}

std::vector<X509Ptr> parseCertificates(const std::vector<uint8_t>& data, std::string& err) {
    std::vector<X509Ptr> certs;
    if (data.empty()) { err = "certificate is empty"; return certs; }

    if (isPem(data)) {
        BioPtr bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
        if (!bio) { err = buildOpenSslErrorMessage("BIO_new_mem_buf"); return certs; }
        while (X509* c = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr))
            certs.emplace_back(c);
        ERR_clear_error(); // Dateiende meldet PEM als Fehler
    } else {
        const unsigned char* p = data.data();
        const unsigned char* end = data.data() + data.size();
        while (p < end) {
            X509* c = d2i_X509(nullptr, &p, static_cast<long>(end - p));
            if (!c) break;
            certs.emplace_back(c);
        }
        ERR_clear_error();
    }
    if (certs.empty()) err = "no certificate found (neither PEM nor DER)";
    return certs;
}

bool certificateMatchesKey(X509* cert, EVP_PKEY* key) {
    const bool ok = X509_check_private_key(cert, key) == 1;
    ERR_clear_error();
    return ok;
}

std::string certificateUri(X509* cert) {
    std::string uri;
    auto* names = static_cast<GENERAL_NAMES*>(X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    if (!names) return uri;
    for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i) {
        const GENERAL_NAME* gn = sk_GENERAL_NAME_value(names, i);
        if (gn->type != GEN_URI) continue;
        const ASN1_IA5STRING* s = gn->d.uniformResourceIdentifier;
        uri.assign(reinterpret_cast<const char*>(ASN1_STRING_get0_data(s)),
                   static_cast<size_t>(ASN1_STRING_length(s)));
        break;
    }
    GENERAL_NAMES_free(names);
    return uri;
}

std::string certificateCommonName(X509* cert) {
    X509_NAME* name = X509_get_subject_name(cert);
    const int idx = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
    if (idx < 0) return {};
    ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, idx));
    unsigned char* utf8 = nullptr;
    const int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0) { ERR_clear_error(); return {}; }
    std::string cn(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return cn;
}

std::vector<uint8_t> certificateToDer(X509* cert) {
    const int len = i2d_X509(cert, nullptr);
    if (len <= 0) return {};
    std::vector<uint8_t> out(static_cast<size_t>(len));
    unsigned char* p = out.data();
    i2d_X509(cert, &p);
    return out;
}

std::vector<uint8_t> privateKeyToDer(EVP_PKEY* key) {
    const int len = i2d_PrivateKey(key, nullptr);
    if (len <= 0) return {};
    std::vector<uint8_t> out(static_cast<size_t>(len));
    unsigned char* p = out.data();
    i2d_PrivateKey(key, &p);
    return out;
}

bool checkValidityWindow(X509* cert, std::string& err) {
    if (X509_cmp_current_time(X509_get0_notBefore(cert)) > 0) {
        err = "certificate is not yet valid";
        return false;
    }
    if (X509_cmp_current_time(X509_get0_notAfter(cert)) < 0) {
        err = "certificate has expired";
        return false;
    }
    return true;
}
