#pragma once

#include "gmailup/constants.hpp"
#include "gmailup/delegate.hpp"
#include "gmailup/media_source.hpp"
#include "gmailup/net/http.hpp"
#include "gmailup/token_provider.hpp"
#include "gmailup/upload.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gmailup {

/// users.messages resource, as far as uploads need it.
struct Message {
    std::optional<std::string> id;
    std::optional<std::string> thread_id;
    std::optional<std::vector<std::string>> label_ids;
    std::optional<std::string> snippet;
    std::optional<std::string> history_id;
    std::optional<std::string> internal_date;  // epoch ms, as a decimal string
    std::optional<int32_t> size_estimate;
    std::optional<std::string> raw;            // base64url RFC 822 message
    std::optional<nlohmann::json> payload;     // MIME tree, passed through untouched
};

struct Draft {
    std::optional<std::string> id;
    std::optional<Message> message;
};

void to_json(nlohmann::json& j, const Message& m);
void from_json(const nlohmann::json& j, Message& m);
void to_json(nlohmann::json& j, const Draft& d);
void from_json(const nlohmann::json& j, Draft& d);

/// Serialize without null members, ready to be sent as upload metadata.
std::string metadata_json(const nlohmann::json& value);

// ----------------------------------------------------------------------------
// Call configurations. Fields map 1:1 onto query and path parameters.
// ----------------------------------------------------------------------------

/// users.messages.send: send a message to its recipients.
struct MessagesSendCall {
    Message request;
    std::string user_id = "me";
    QueryParams additional_params;
    std::vector<std::string> scopes;
};

/// users.messages.insert: place a message in the mailbox without sending it.
struct MessagesInsertCall {
    Message request;
    std::string user_id = "me";
    std::optional<std::string> internal_date_source;  // "receivedTime" | "dateHeader"
    std::optional<bool> deleted;
    QueryParams additional_params;
    std::vector<std::string> scopes;
};

/// users.messages.import: insert with delivery-style scanning and classification.
struct MessagesImportCall {
    Message request;
    std::string user_id = "me";
    std::optional<std::string> internal_date_source;
    std::optional<bool> never_mark_spam;
    std::optional<bool> process_for_calendar;
    std::optional<bool> deleted;
    QueryParams additional_params;
    std::vector<std::string> scopes;
};

/// users.drafts.create
struct DraftsCreateCall {
    Draft request;
    std::string user_id = "me";
    QueryParams additional_params;
    std::vector<std::string> scopes;
};

/// users.drafts.update: replace a draft's content.
struct DraftsUpdateCall {
    Draft request;
    std::string user_id = "me";
    std::string id;
    QueryParams additional_params;
    std::vector<std::string> scopes;
};

UploadCall make_upload_call(const std::string& root_url, const MessagesSendCall& call);
UploadCall make_upload_call(const std::string& root_url, const MessagesInsertCall& call);
UploadCall make_upload_call(const std::string& root_url, const MessagesImportCall& call);
UploadCall make_upload_call(const std::string& root_url, const DraftsCreateCall& call);
UploadCall make_upload_call(const std::string& root_url, const DraftsUpdateCall& call);

struct GmailOptions {
    std::string root_url = constants::DEFAULT_ROOT_URL;
    std::string user_agent = "gmail-upload/1.0";
    bool refresh_token_per_chunk = false;
};

/// Entry point for the Gmail upload operations.
///
/// Borrows the transport and token provider. Every operation accepts
/// `message/*` media and is available over both upload protocols.
class Gmail {
public:
    Gmail(net::HttpTransport& transport, TokenProvider& tokens, GmailOptions options = {});

    UploadOutcome<Message> messages_send(const MessagesSendCall& call, MediaSource& media,
                                         const std::string& mime_type, UploadProtocol protocol,
                                         Delegate& delegate);
    UploadOutcome<Message> messages_insert(const MessagesInsertCall& call, MediaSource& media,
                                           const std::string& mime_type, UploadProtocol protocol,
                                           Delegate& delegate);
    UploadOutcome<Message> messages_import(const MessagesImportCall& call, MediaSource& media,
                                           const std::string& mime_type, UploadProtocol protocol,
                                           Delegate& delegate);
    UploadOutcome<Draft> drafts_create(const DraftsCreateCall& call, MediaSource& media,
                                       const std::string& mime_type, UploadProtocol protocol,
                                       Delegate& delegate);
    UploadOutcome<Draft> drafts_update(const DraftsUpdateCall& call, MediaSource& media,
                                       const std::string& mime_type, UploadProtocol protocol,
                                       Delegate& delegate);

    const GmailOptions& options() const { return options_; }

private:
    GmailOptions options_;
    Uploader uploader_;
};

}  // namespace gmailup
