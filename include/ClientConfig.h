// ClientConfig – deklarative Client-Konfiguration
//
// Wird vom Host (UI, Demo, Tests) befüllt oder per loadConfigFile() aus JSON gelesen.
// Die Prüfung auf gültige Kombinationen und das Laden von Zertifikat/Schlüssel passiert
// erst im SecureChannelProvisioner; hier wird nur (de)serialisiert.
//
// JSON-Schlüssel (alle optional):
//   endpoint_url, security_policy, security_mode, auth_mode, username, password,
//   user_token_policy_id, cert_file, key_file, application_uri, product_uri,
//   session_name, session_timeout_s, connect_timeout_s, retry_attempts,
//   retry_delay_s, auto_generate_cert, disable_log, auto_connect, api_enabled, api_port
#pragma once
#include <string>
#include <nlohmann/json.hpp>

struct ClientConfig {
    std::string endpointUrl = "opc.tcp://localhost:4840";
    std::string securityPolicy = "None";    // Kurzname oder volle URI
    std::string securityMode   = "None";    // None | Sign | SignAndEncrypt
    std::string authMode       = "Anonymous"; // Anonymous | Username (Certificate wird abgelehnt)
    std::string username;
    std::string password;
    std::string userTokenPolicyId;
    std::string certFile;
    std::string keyFile;
    std::string applicationUri;
    std::string productUri     = "urn:uabridge:client";
    std::string sessionName;
    double      sessionTimeoutSec = 3600.0;
    double      connectTimeoutSec = 10.0;
    int         retryAttempts     = 3;
    double      retryDelaySec     = 1.0;
    bool        autoGenerateCert  = false;
    bool        disableLog        = false;
    bool        autoConnect       = false;
    bool        apiEnabled        = false;
    int         apiPort           = 8080;
};

void to_json(nlohmann::json& j, const ClientConfig& c);
void from_json(const nlohmann::json& j, ClientConfig& c);

bool loadConfigFile(const std::string& path, ClientConfig& out, std::string& err);
bool parseConfigJson(const std::string& text, ClientConfig& out, std::string& err);
