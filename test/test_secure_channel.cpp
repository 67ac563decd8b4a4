#include "CertificateGenerator.h"
#include "SecureChannelProvisioner.h"

#include <gtest/gtest.h>
#include <filesystem>
#include <random>

namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("uabridge_test_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

ClientConfig secureConfig() {
    ClientConfig c;
    c.endpointUrl = "opc.tcp://localhost:4840";
    c.securityPolicy = "Basic256Sha256";
    c.securityMode = "SignAndEncrypt";
    return c;
}

} // namespace

TEST(SecureChannelProvisioner, AnonymousNoneIsAccepted) {
    SecureChannelProvisioner p;
    ClientConfig c;
    c.sessionName = "bench";
    TransportOptions o;
    std::string err;
    ASSERT_TRUE(p.provision(c, o, err)) << err;
    EXPECT_EQ(o.securityMode, SecurityMode::None);
    EXPECT_EQ(o.securityPolicyUri, SecureChannelProvisioner::kPolicyNoneUri);
    EXPECT_EQ(o.identity, IdentityKind::Anonymous);
    EXPECT_TRUE(o.certificateDer.empty());
    EXPECT_EQ(o.sessionName, "bench");
    EXPECT_EQ(o.connectTimeout, std::chrono::milliseconds(10000));
}

TEST(SecureChannelProvisioner, RejectsBadEndpoint) {
    SecureChannelProvisioner p;
    ClientConfig c;
    c.endpointUrl = "http://localhost:4840";
    TransportOptions o;
    std::string err;
    EXPECT_FALSE(p.provision(c, o, err));
    EXPECT_EQ(err.rfind("endpoint URL must start with opc.tcp://", 0), 0u);
}

TEST(SecureChannelProvisioner, RejectsSignWithPolicyNone) {
    SecureChannelProvisioner p;
    ClientConfig c;
    c.securityMode = "Sign";
    c.securityPolicy = "None";
    TransportOptions o;
    std::string err;
    EXPECT_FALSE(p.provision(c, o, err));
    EXPECT_EQ(err, "security mode Sign requires a security policy other than None");
}

TEST(SecureChannelProvisioner, RejectsModeNoneWithSecurePolicy) {
    SecureChannelProvisioner p;
    ClientConfig c;
    c.securityMode = "None";
    c.securityPolicy = "Basic256Sha256";
    TransportOptions o;
    std::string err;
    EXPECT_FALSE(p.provision(c, o, err));
    EXPECT_EQ(err, "security mode None requires security policy None "
                   "(got http://opcfoundation.org/UA/SecurityPolicy#Basic256Sha256)");
}

TEST(SecureChannelProvisioner, RejectsCertificateIdentityAndMissingUsername) {
    SecureChannelProvisioner p;
    TransportOptions o;
    std::string err;

    ClientConfig c;
    c.authMode = "Certificate";
    EXPECT_FALSE(p.provision(c, o, err));
    EXPECT_EQ(err, "certificate user identity is not supported");

    c.authMode = "Username";
    EXPECT_FALSE(p.provision(c, o, err));
    EXPECT_EQ(err, "auth mode Username requires a username");

    c.username = "op";
    c.password = "secret";
    ASSERT_TRUE(p.provision(c, o, err)) << err;
    EXPECT_EQ(o.identity, IdentityKind::Username);
    EXPECT_EQ(o.password, "secret");
}

TEST(SecureChannelProvisioner, UnknownPolicyAndMode) {
    std::string uri, err;
    EXPECT_TRUE(SecureChannelProvisioner::normalizeSecurityPolicy("basic256sha256", uri, err));
    EXPECT_EQ(uri, "http://opcfoundation.org/UA/SecurityPolicy#Basic256Sha256");
    EXPECT_FALSE(SecureChannelProvisioner::normalizeSecurityPolicy("Rot13", uri, err));
    EXPECT_EQ(err, "unknown security policy 'Rot13'");

    SecurityMode m;
    EXPECT_TRUE(SecureChannelProvisioner::parseSecurityMode("sign_and_encrypt", m, err));
    EXPECT_EQ(m, SecurityMode::SignAndEncrypt);
    EXPECT_FALSE(SecureChannelProvisioner::parseSecurityMode("Loud", m, err));
}

TEST(SecureChannelProvisioner, SecureModeNeedsCertificate) {
    SecureChannelProvisioner p;
    TransportOptions o;
    std::string err;
    ClientConfig c = secureConfig();
    EXPECT_FALSE(p.provision(c, o, err));
    EXPECT_EQ(err, "secure mode requires cert_file and key_file");

    c.certFile = "/nonexistent/client.der";
    EXPECT_FALSE(p.provision(c, o, err));
    EXPECT_EQ(err, "cert_file and key_file must be set together");
}

TEST(SecureChannelProvisioner, RejectsMismatchedKeyPair) {
    TempDir dir;
    CertificateGenerator gen(dir.str());
    CertificateRequest req;
    req.applicationUri = "urn:test:uabridge";
    req.keyBits = 2048;
    CertificateArtifacts a, b;
    std::string err;
    ASSERT_TRUE(gen.issueSelfSigned(req, "a", a, err)) << err;
    ASSERT_TRUE(gen.issueSelfSigned(req, "b", b, err)) << err;

    ClientConfig c = secureConfig();
    c.certFile = a.derPath;
    c.keyFile  = b.keyPath;
    SecureChannelProvisioner p;
    TransportOptions o;
    EXPECT_FALSE(p.provision(c, o, err));
    EXPECT_NE(err.find("does not match"), std::string::npos) << err;

    c.keyFile = a.keyPath;
    ASSERT_TRUE(p.provision(c, o, err)) << err;
    EXPECT_FALSE(o.certificateDer.empty());
    EXPECT_FALSE(o.privateKeyDer.empty());
    EXPECT_EQ(o.applicationUri, "urn:test:uabridge");
}

TEST(SecureChannelProvisioner, AutoGeneratesClientCertificate) {
    TempDir dir;
    SecureChannelProvisioner::Options opt;
    opt.certificateDir = dir.str();
    SecureChannelProvisioner p(opt);

    ClientConfig c = secureConfig();
    c.autoGenerateCert = true;
    c.applicationUri = "urn:auto:uabridge";
    TransportOptions o;
    std::string err;
    ASSERT_TRUE(p.provision(c, o, err)) << err;
    EXPECT_FALSE(o.certificateDer.empty());
    EXPECT_EQ(o.applicationUri, "urn:auto:uabridge");
    EXPECT_TRUE(fs::exists(fs::path(dir.str()) / "ca.crt"));
    EXPECT_TRUE(fs::exists(fs::path(dir.str()) / "client.der"));
}

TEST(CertificateGenerator, LocalCaIsReused) {
    TempDir dir;
    CertificateGenerator gen(dir.str());
    std::string err;
    ASSERT_TRUE(gen.ensureLocalCA(err)) << err;
    const auto stamp = fs::last_write_time(gen.caCertPath());
    ASSERT_TRUE(gen.ensureLocalCA(err)) << err;
    EXPECT_EQ(fs::last_write_time(gen.caCertPath()), stamp);

    CertificateInfo info;
    ASSERT_TRUE(readCertificateInfo(gen.caCertPath(), info, err)) << err;
    EXPECT_TRUE(info.isCa);
}

TEST(CertificateGenerator, ClientCertificateCarriesApplicationUri) {
    TempDir dir;
    CertificateGenerator gen(dir.str());
    CertificateRequest req;
    req.commonName = "Bench Client";
    req.applicationUri = "urn:bench:uabridge";
    req.dnsNames = { "bench.local" };
    CertificateArtifacts art;
    std::string err;
    ASSERT_TRUE(gen.issueClientCertificate(req, "client", art, err)) << err;
    EXPECT_TRUE(validateCertificateFiles(art.derPath, art.keyPath, err)) << err;
    EXPECT_TRUE(validateCertificateFiles(art.pemPath, art.pkcs8Path, err)) << err;

    CertificateInfo info;
    ASSERT_TRUE(readCertificateInfo(art.pemPath, info, err)) << err;
    EXPECT_FALSE(info.isCa);
    EXPECT_NE(info.subject.find("Bench Client"), std::string::npos);
    ASSERT_EQ(info.uris.size(), 1u);
    EXPECT_EQ(info.uris[0], "urn:bench:uabridge");
    EXPECT_EQ(info.dnsNames, (std::vector<std::string>{ "bench.local" }));
}

TEST(CertificateGenerator, CsrWritesRequestAndKey) {
    TempDir dir;
    CertificateGenerator gen(dir.str());
    CertificateRequest req;
    req.applicationUri = "urn:csr:uabridge";
    std::string csr, key, err;
    ASSERT_TRUE(gen.generateCsr(req, "req", csr, key, err)) << err;
    EXPECT_TRUE(fs::exists(csr));
    EXPECT_TRUE(fs::exists(key));
}
