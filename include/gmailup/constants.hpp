#pragma once

#include <cstddef>
#include <cstdint>

namespace gmailup::constants {

// API endpoints
constexpr const char* DEFAULT_ROOT_URL = "https://gmail.googleapis.com/";
constexpr const char* DEFAULT_TOKEN_URI = "https://oauth2.googleapis.com/token";

// Scopes
constexpr const char* SCOPE_FULL_ACCESS = "https://mail.google.com/";
constexpr const char* SCOPE_MODIFY = "https://www.googleapis.com/auth/gmail.modify";
constexpr const char* SCOPE_COMPOSE = "https://www.googleapis.com/auth/gmail.compose";
constexpr const char* SCOPE_INSERT = "https://www.googleapis.com/auth/gmail.insert";
constexpr const char* SCOPE_SEND = "https://www.googleapis.com/auth/gmail.send";

// Per-operation upload limits
constexpr uint64_t MAX_SEND_UPLOAD_SIZE = 36ULL * 1024 * 1024;     // 36 MiB
constexpr uint64_t MAX_IMPORT_UPLOAD_SIZE = 50ULL * 1024 * 1024;   // 50 MiB
constexpr const char* ACCEPTED_MESSAGE_MIME = "message/*";
constexpr const char* DEFAULT_MESSAGE_MIME = "message/rfc822";

// Multipart
constexpr const char* MULTIPART_BOUNDARY = "MDuXWGyeE33QFXGchb2VFWc4Z7945d";

// Resumable transfers
constexpr uint64_t RESUMABLE_CHUNK_GRANULARITY = 256 * 1024;  // 256 KiB
constexpr uint64_t DEFAULT_BACKOFF_CHUNK_SIZE = 8 * 1024 * 1024;  // 8 MiB

// Retry defaults (BackoffDelegate)
constexpr int DEFAULT_MAX_RETRIES = 5;
constexpr int DEFAULT_INITIAL_RETRY_DELAY_MS = 1000;
constexpr double DEFAULT_RETRY_BACKOFF_MULTIPLIER = 2.0;
constexpr int DEFAULT_MAX_RETRY_DELAY_MS = 32000;

// Token cache
constexpr int TOKEN_LIFETIME_SECONDS = 3600;
constexpr int TOKEN_REFRESH_MARGIN_SECONDS = 300;

} // namespace gmailup::constants
