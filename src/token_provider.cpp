#include "gmailup/token_provider.hpp"
#include "gmailup/constants.hpp"
#include "gmailup/log.hpp"

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <fstream>
#include <sstream>

namespace gmailup {

namespace {

std::string join_scopes(const std::vector<std::string>& scopes) {
    std::string joined;
    for (const auto& s : scopes) {
        if (!joined.empty()) joined += " ";
        joined += s;
    }
    return joined;
}

std::string b64url(const std::string& s) {
    return net::base64url_encode(std::vector<uint8_t>(s.begin(), s.end()));
}

}  // namespace

TokenResult StaticTokenProvider::get_token(const std::vector<std::string>& /*scopes*/) {
    return TokenResult::of(token_);
}

TokenResult NoTokenProvider::get_token(const std::vector<std::string>& /*scopes*/) {
    return TokenResult::none();
}

// ============================================================================
// Service account key
// ============================================================================

std::optional<ServiceAccountKey> ServiceAccountKey::from_json(const std::string& json,
                                                              std::string& error) {
    try {
        auto j = nlohmann::json::parse(json);
        ServiceAccountKey key;
        key.client_email = j.value("client_email", "");
        key.private_key = j.value("private_key", "");
        key.private_key_id = j.value("private_key_id", "");
        key.token_uri = j.value("token_uri", "");

        if (key.client_email.empty() || key.private_key.empty()) {
            error = "service account key requires client_email and private_key";
            return std::nullopt;
        }
        if (key.token_uri.empty()) {
            key.token_uri = constants::DEFAULT_TOKEN_URI;
        }
        return key;
    } catch (const nlohmann::json::exception& e) {
        error = std::string("invalid service account JSON: ") + e.what();
        return std::nullopt;
    }
}

std::optional<ServiceAccountKey> ServiceAccountKey::from_file(const std::filesystem::path& path,
                                                              std::string& error) {
    std::ifstream f(path);
    if (!f) {
        error = "cannot open credentials file: " + path.string();
        return std::nullopt;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return from_json(ss.str(), error);
}

// ============================================================================
// ServiceAccountTokenProvider
// ============================================================================

ServiceAccountTokenProvider::ServiceAccountTokenProvider(net::HttpTransport& transport,
                                                         ServiceAccountKey key,
                                                         std::string subject)
    : transport_(transport)
    , key_(std::move(key))
    , subject_(std::move(subject)) {}

std::string ServiceAccountTokenProvider::make_assertion(const std::string& scope,
                                                        int64_t issued_at) const {
    nlohmann::json header = {{"alg", "RS256"}, {"typ", "JWT"}};
    if (!key_.private_key_id.empty()) {
        header["kid"] = key_.private_key_id;
    }
    nlohmann::json claims = {
        {"iss", key_.client_email},
        {"scope", scope},
        {"aud", key_.token_uri},
        {"iat", issued_at},
        {"exp", issued_at + constants::TOKEN_LIFETIME_SECONDS},
    };
    if (!subject_.empty()) {
        claims["sub"] = subject_;
    }

    std::string signing_input = b64url(header.dump()) + "." + b64url(claims.dump());
    std::string signature = rsa_sign_sha256(key_.private_key, signing_input);
    if (signature.empty()) {
        return "";
    }
    return signing_input + "." + b64url(signature);
}

TokenResult ServiceAccountTokenProvider::get_token(const std::vector<std::string>& scopes) {
    std::lock_guard lock(token_mutex_);

    std::string scope = join_scopes(scopes);
    auto now = std::chrono::steady_clock::now();
    auto margin = std::chrono::seconds(constants::TOKEN_REFRESH_MARGIN_SECONDS);

    auto it = cache_.find(scope);
    if (it != cache_.end() && now < it->second.expiry - margin) {
        return TokenResult::of(it->second.token);
    }

    auto iat = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string jwt = make_assertion(scope, iat);
    if (jwt.empty()) {
        return TokenResult::failed("failed to sign JWT assertion for " + key_.client_email);
    }

    std::string post_body =
        "grant_type=urn%3Aietf%3Aparams%3Aoauth%3Agrant-type%3Ajwt-bearer&assertion=" + jwt;
    auto request = net::HttpRequest::post(
        key_.token_uri, std::vector<uint8_t>(post_body.begin(), post_body.end()));
    request.headers.set_content_type("application/x-www-form-urlencoded");

    auto response = transport_.execute(request);
    if (response.is_network_error) {
        return TokenResult::failed("token request failed: " + response.error);
    }
    if (!response.ok()) {
        return TokenResult::failed("token endpoint returned HTTP " +
                                   std::to_string(response.status_code) + ": " +
                                   response.body_string());
    }

    try {
        auto j = nlohmann::json::parse(response.body_string());
        std::string token = j.value("access_token", "");
        if (token.empty()) {
            return TokenResult::failed("token response has no access_token");
        }
        int64_t expires_in = j.value("expires_in", int64_t{constants::TOKEN_LIFETIME_SECONDS});
        cache_[scope] = CachedToken{token, now + std::chrono::seconds(expires_in)};
        log_debug("Obtained access token for %s (expires in %lld s)",
                  key_.client_email.c_str(), static_cast<long long>(expires_in));
        return TokenResult::of(std::move(token));
    } catch (const nlohmann::json::exception& e) {
        return TokenResult::failed(std::string("invalid token response: ") + e.what());
    }
}

std::string rsa_sign_sha256(const std::string& pem_key, const std::string& data) {
    BIO* bio = BIO_new_mem_buf(pem_key.data(), static_cast<int>(pem_key.size()));
    if (!bio) return "";

    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!pkey) return "";

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) { EVP_PKEY_free(pkey); return ""; }

    std::string signature;
    if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, pkey) == 1 &&
        EVP_DigestSignUpdate(ctx, data.data(), data.size()) == 1) {
        size_t sig_len = 0;
        if (EVP_DigestSignFinal(ctx, nullptr, &sig_len) == 1) {
            signature.resize(sig_len);
            if (EVP_DigestSignFinal(ctx, reinterpret_cast<unsigned char*>(signature.data()),
                                    &sig_len) == 1) {
                signature.resize(sig_len);
            } else {
                signature.clear();
            }
        }
    }

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return signature;
}

}  // namespace gmailup
