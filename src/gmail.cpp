#include "gmailup/gmail.hpp"

namespace gmailup {

namespace {

template <typename T>
void set_optional(nlohmann::json& j, const char* name, const std::optional<T>& value) {
    if (value) {
        j[name] = *value;
    } else {
        j[name] = nullptr;
    }
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* name, std::optional<T>& value) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        value.reset();
        return;
    }
    value = it->template get<T>();
}

// Gmail encodes int64 fields as strings; tolerate plain numbers too.
void get_int64_string(const nlohmann::json& j, const char* name, std::optional<std::string>& value) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        value.reset();
    } else if (it->is_number()) {
        value = it->dump();
    } else {
        value = it->get<std::string>();
    }
}

const char* bool_param(bool v) { return v ? "true" : "false"; }

std::string upload_base(const std::string& root_url) {
    return root_url + "upload/gmail/v1/users/{userId}/";
}

UploadCall base_call(const char* id, net::HttpMethod method, std::string url,
                     const std::string& user_id, uint64_t max_size,
                     const QueryParams& additional, const std::vector<std::string>& scopes,
                     std::string metadata) {
    UploadCall call;
    call.method = MethodInfo{id, method};
    call.url = std::move(url);
    call.path_params.emplace_back("userId", user_id);
    call.reserved_params = {"alt", "userId", "uploadType"};
    call.additional_params = additional;
    call.scopes = scopes;
    call.default_scope = constants::SCOPE_FULL_ACCESS;
    call.max_size = max_size;
    call.accepted_mime = constants::ACCEPTED_MESSAGE_MIME;
    call.metadata_json = std::move(metadata);
    return call;
}

}  // namespace

// ============================================================================
// Schema
// ============================================================================

void to_json(nlohmann::json& j, const Message& m) {
    j = nlohmann::json::object();
    set_optional(j, "id", m.id);
    set_optional(j, "threadId", m.thread_id);
    set_optional(j, "labelIds", m.label_ids);
    set_optional(j, "snippet", m.snippet);
    set_optional(j, "historyId", m.history_id);
    set_optional(j, "internalDate", m.internal_date);
    set_optional(j, "sizeEstimate", m.size_estimate);
    set_optional(j, "raw", m.raw);
    set_optional(j, "payload", m.payload);
}

void from_json(const nlohmann::json& j, Message& m) {
    get_optional(j, "id", m.id);
    get_optional(j, "threadId", m.thread_id);
    get_optional(j, "labelIds", m.label_ids);
    get_optional(j, "snippet", m.snippet);
    get_int64_string(j, "historyId", m.history_id);
    get_int64_string(j, "internalDate", m.internal_date);
    get_optional(j, "sizeEstimate", m.size_estimate);
    get_optional(j, "raw", m.raw);
    get_optional(j, "payload", m.payload);
}

void to_json(nlohmann::json& j, const Draft& d) {
    j = nlohmann::json::object();
    set_optional(j, "id", d.id);
    if (d.message) {
        j["message"] = *d.message;
    } else {
        j["message"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, Draft& d) {
    get_optional(j, "id", d.id);
    get_optional(j, "message", d.message);
}

std::string metadata_json(const nlohmann::json& value) {
    nlohmann::json copy = value;
    remove_json_null_values(copy);
    return copy.dump();
}

// ============================================================================
// Call configurations
// ============================================================================

UploadCall make_upload_call(const std::string& root_url, const MessagesSendCall& c) {
    return base_call("gmail.users.messages.send", net::HttpMethod::POST,
                     upload_base(root_url) + "messages/send", c.user_id,
                     constants::MAX_SEND_UPLOAD_SIZE, c.additional_params, c.scopes,
                     metadata_json(c.request));
}

UploadCall make_upload_call(const std::string& root_url, const MessagesInsertCall& c) {
    auto call = base_call("gmail.users.messages.insert", net::HttpMethod::POST,
                          upload_base(root_url) + "messages", c.user_id,
                          constants::MAX_IMPORT_UPLOAD_SIZE, c.additional_params, c.scopes,
                          metadata_json(c.request));
    if (c.internal_date_source) call.params.emplace_back("internalDateSource", *c.internal_date_source);
    if (c.deleted) call.params.emplace_back("deleted", bool_param(*c.deleted));
    call.reserved_params.insert(call.reserved_params.end(), {"internalDateSource", "deleted"});
    return call;
}

UploadCall make_upload_call(const std::string& root_url, const MessagesImportCall& c) {
    auto call = base_call("gmail.users.messages.import", net::HttpMethod::POST,
                          upload_base(root_url) + "messages/import", c.user_id,
                          constants::MAX_IMPORT_UPLOAD_SIZE, c.additional_params, c.scopes,
                          metadata_json(c.request));
    if (c.process_for_calendar) call.params.emplace_back("processForCalendar", bool_param(*c.process_for_calendar));
    if (c.never_mark_spam) call.params.emplace_back("neverMarkSpam", bool_param(*c.never_mark_spam));
    if (c.internal_date_source) call.params.emplace_back("internalDateSource", *c.internal_date_source);
    if (c.deleted) call.params.emplace_back("deleted", bool_param(*c.deleted));
    call.reserved_params.insert(call.reserved_params.end(),
                                {"processForCalendar", "neverMarkSpam", "internalDateSource", "deleted"});
    return call;
}

UploadCall make_upload_call(const std::string& root_url, const DraftsCreateCall& c) {
    return base_call("gmail.users.drafts.create", net::HttpMethod::POST,
                     upload_base(root_url) + "drafts", c.user_id,
                     constants::MAX_SEND_UPLOAD_SIZE, c.additional_params, c.scopes,
                     metadata_json(c.request));
}

UploadCall make_upload_call(const std::string& root_url, const DraftsUpdateCall& c) {
    auto call = base_call("gmail.users.drafts.update", net::HttpMethod::PUT,
                          upload_base(root_url) + "drafts/{id}", c.user_id,
                          constants::MAX_SEND_UPLOAD_SIZE, c.additional_params, c.scopes,
                          metadata_json(c.request));
    call.path_params.emplace_back("id", c.id);
    call.reserved_params.push_back("id");
    return call;
}

// ============================================================================
// Gmail
// ============================================================================

Gmail::Gmail(net::HttpTransport& transport, TokenProvider& tokens, GmailOptions options)
    : options_(std::move(options))
    , uploader_(transport, tokens,
                UploaderOptions{options_.user_agent, options_.refresh_token_per_chunk}) {}

UploadOutcome<Message> Gmail::messages_send(const MessagesSendCall& call, MediaSource& media,
                                            const std::string& mime_type,
                                            UploadProtocol protocol, Delegate& delegate) {
    return uploader_.upload<Message>(make_upload_call(options_.root_url, call), media,
                                     mime_type, protocol, delegate);
}

UploadOutcome<Message> Gmail::messages_insert(const MessagesInsertCall& call, MediaSource& media,
                                              const std::string& mime_type,
                                              UploadProtocol protocol, Delegate& delegate) {
    return uploader_.upload<Message>(make_upload_call(options_.root_url, call), media,
                                     mime_type, protocol, delegate);
}

UploadOutcome<Message> Gmail::messages_import(const MessagesImportCall& call, MediaSource& media,
                                              const std::string& mime_type,
                                              UploadProtocol protocol, Delegate& delegate) {
    return uploader_.upload<Message>(make_upload_call(options_.root_url, call), media,
                                     mime_type, protocol, delegate);
}

UploadOutcome<Draft> Gmail::drafts_create(const DraftsCreateCall& call, MediaSource& media,
                                          const std::string& mime_type,
                                          UploadProtocol protocol, Delegate& delegate) {
    return uploader_.upload<Draft>(make_upload_call(options_.root_url, call), media,
                                   mime_type, protocol, delegate);
}

UploadOutcome<Draft> Gmail::drafts_update(const DraftsUpdateCall& call, MediaSource& media,
                                          const std::string& mime_type,
                                          UploadProtocol protocol, Delegate& delegate) {
    return uploader_.upload<Draft>(make_upload_call(options_.root_url, call), media,
                                   mime_type, protocol, delegate);
}

}  // namespace gmailup
