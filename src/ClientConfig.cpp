#include "ClientConfig.h"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

void to_json(json& j, const ClientConfig& c) {
    j = json{
        {"endpoint_url",         c.endpointUrl},
        {"security_policy",      c.securityPolicy},
        {"security_mode",        c.securityMode},
        {"auth_mode",            c.authMode},
        {"username",             c.username},
        {"password",             c.password},
        {"user_token_policy_id", c.userTokenPolicyId},
        {"cert_file",            c.certFile},
        {"key_file",             c.keyFile},
        {"application_uri",      c.applicationUri},
        {"product_uri",          c.productUri},
        {"session_name",         c.sessionName},
        {"session_timeout_s",    c.sessionTimeoutSec},
        {"connect_timeout_s",    c.connectTimeoutSec},
        {"retry_attempts",       c.retryAttempts},
        {"retry_delay_s",        c.retryDelaySec},
        {"auto_generate_cert",   c.autoGenerateCert},
        {"disable_log",          c.disableLog},
        {"auto_connect",         c.autoConnect},
        {"api_enabled",          c.apiEnabled},
        {"api_port",             c.apiPort},
    };
}

void from_json(const json& j, ClientConfig& c) {
    const ClientConfig d;
    c.endpointUrl       = j.value("endpoint_url",         d.endpointUrl);
    c.securityPolicy    = j.value("security_policy",      d.securityPolicy);
    c.securityMode      = j.value("security_mode",        d.securityMode);
    c.authMode          = j.value("auth_mode",            d.authMode);
    c.username          = j.value("username",             d.username);
    c.password          = j.value("password",             d.password);
    c.userTokenPolicyId = j.value("user_token_policy_id", d.userTokenPolicyId);
    c.certFile          = j.value("cert_file",            d.certFile);
    c.keyFile           = j.value("key_file",             d.keyFile);
    c.applicationUri    = j.value("application_uri",      d.applicationUri);
    c.productUri        = j.value("product_uri",          d.productUri);
    c.sessionName       = j.value("session_name",         d.sessionName);
    c.sessionTimeoutSec = j.value("session_timeout_s",    d.sessionTimeoutSec);
    c.connectTimeoutSec = j.value("connect_timeout_s",    d.connectTimeoutSec);
    c.retryAttempts     = j.value("retry_attempts",       d.retryAttempts);
    c.retryDelaySec     = j.value("retry_delay_s",        d.retryDelaySec);
    c.autoGenerateCert  = j.value("auto_generate_cert",   d.autoGenerateCert);
    c.disableLog        = j.value("disable_log",          d.disableLog);
    c.autoConnect       = j.value("auto_connect",         d.autoConnect);
    c.apiEnabled        = j.value("api_enabled",          d.apiEnabled);
    c.apiPort           = j.value("api_port",             d.apiPort);
}

bool parseConfigJson(const std::string& text, ClientConfig& out, std::string& err) {
    try {
        const json j = json::parse(text);
        if (!j.is_object()) { err = "config root must be a JSON object"; return false; }
        out = j.get<ClientConfig>();
        return true;
    } catch (const json::exception& e) {
        err = std::string("invalid config JSON: ") + e.what();
        return false;
    }
}

bool loadConfigFile(const std::string& path, ClientConfig& out, std::string& err) {
    std::ifstream f(path);
    if (!f) { err = "cannot open config file " + path; return false; }
    std::ostringstream ss;
    ss << f.rdbuf();
    return parseConfigJson(ss.str(), out, err);
}
