#pragma once

#include "gmailup/net/http.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gmailup {

/// Outcome of a token request. `token` may be empty on success when the
/// provider deliberately supplies no credentials.
struct TokenResult {
    std::optional<std::string> token;
    std::string error;

    bool ok() const { return error.empty(); }

    static TokenResult of(std::string token) { return {std::move(token), {}}; }
    static TokenResult none() { return {}; }
    static TokenResult failed(std::string error) { return {std::nullopt, std::move(error)}; }
};

/// Source of OAuth2 bearer tokens for a set of scopes.
class TokenProvider {
public:
    virtual ~TokenProvider() = default;
    virtual TokenResult get_token(const std::vector<std::string>& scopes) = 0;
};

/// Always returns the same token.
class StaticTokenProvider : public TokenProvider {
public:
    explicit StaticTokenProvider(std::string token) : token_(std::move(token)) {}
    TokenResult get_token(const std::vector<std::string>& scopes) override;

private:
    std::string token_;
};

/// Sends requests without an Authorization header.
class NoTokenProvider : public TokenProvider {
public:
    TokenResult get_token(const std::vector<std::string>& scopes) override;
};

/// Fields of a Google service account key file.
struct ServiceAccountKey {
    std::string client_email;
    std::string private_key;  // PEM
    std::string private_key_id;
    std::string token_uri;

    /// Parse key JSON. Returns nullopt and sets `error` on failure.
    static std::optional<ServiceAccountKey> from_json(const std::string& json, std::string& error);
    static std::optional<ServiceAccountKey> from_file(const std::filesystem::path& path,
                                                      std::string& error);
};

/// OAuth2 JWT-bearer flow for service accounts.
///
/// Signs an RS256 assertion with the account's private key, exchanges it at
/// the token URI and caches the access token per scope set until five
/// minutes before it expires. Thread-safe.
class ServiceAccountTokenProvider : public TokenProvider {
public:
    /// @param transport  HTTP transport used for the token exchange (borrowed).
    /// @param key        Service account key.
    /// @param subject    User to impersonate via domain-wide delegation (optional).
    ServiceAccountTokenProvider(net::HttpTransport& transport,
                                ServiceAccountKey key,
                                std::string subject = {});

    TokenResult get_token(const std::vector<std::string>& scopes) override;

    /// Build the signed JWT assertion. Empty on signing failure.
    std::string make_assertion(const std::string& scope, int64_t issued_at) const;

private:
    struct CachedToken {
        std::string token;
        std::chrono::steady_clock::time_point expiry;
    };

    net::HttpTransport& transport_;
    ServiceAccountKey key_;
    std::string subject_;

    std::mutex token_mutex_;
    std::map<std::string, CachedToken> cache_;
};

/// RSA-SHA256 signature of `data` with a PEM private key. Empty on failure.
std::string rsa_sign_sha256(const std::string& pem_key, const std::string& data);

}  // namespace gmailup
