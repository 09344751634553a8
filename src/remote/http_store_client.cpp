#include "http_store_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <sync/cancellation.hpp>
#include <curl/curl.h>
#include <json/json.h>
#include <fmt/format.h>
#include <memory>

// ── libcurl plumbing ─────────────────────────────────────────

namespace {

struct CurlGlobal {
    CURLcode init_rc;
    CurlGlobal() : init_rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() { if (init_rc == CURLE_OK) curl_global_cleanup(); }
};

// First use happens on the main thread, before any worker starts
const CurlGlobal& curl_global() {
    static CurlGlobal global;
    return global;
}

struct EasyDeleter  { void operator()(CURL* h) const { curl_easy_cleanup(h); } };
struct SlistDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };
struct MimeDeleter  { void operator()(curl_mime* m) const { curl_mime_free(m); } };

using EasyPtr  = std::unique_ptr<CURL, EasyDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;
using MimePtr  = std::unique_ptr<curl_mime, MimeDeleter>;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int xfer_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return (token && token->is_cancelled()) ? 1 : 0;
}

RemoteError::Kind classify_curl_code(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_OPERATION_TIMEDOUT:
            return RemoteError::Kind::Connection;
        case CURLE_ABORTED_BY_CALLBACK:
            return RemoteError::Kind::Cancelled;
        default:
            return RemoteError::Kind::Transient;
    }
}

std::string json_string(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : std::string();
}

bool parse_json(const std::string& body, Json::Value& root, std::string& errs) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(body.data(), body.data() + body.size(), &root, &errs);
}

} // namespace

// ── HttpStoreClient ──────────────────────────────────────────

HttpStoreClient::HttpStoreClient(const ApiConfig& api)
    : base_url_(api.endpoint.empty() ? DEFAULT_ENDPOINT : api.endpoint),
      token_(api.token),
      connect_timeout_(api.connect_timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    curl_global();
}

RemoteError::Kind HttpStoreClient::classify_http_status(long status) {
    if (status == 408 || status == 429 || status >= 500) {
        return RemoteError::Kind::Transient;
    }
    if (status >= 400) {
        return RemoteError::Kind::Client;
    }
    return RemoteError::Kind::Transient;
}

std::string HttpStoreClient::error_message(const std::string& body, long status) {
    Json::Value root;
    std::string errs;
    if (!body.empty() && parse_json(body, root, errs) && root.isObject()) {
        std::string msg = json_string(root, "message");
        if (msg.empty()) msg = json_string(root, "error");
        if (!msg.empty()) return msg;
    }
    return fmt::format("Unknown error (HTTP {})", status);
}

std::string HttpStoreClient::connection_hints(const std::string& endpoint) {
    return fmt::format(
        "Cannot connect to API server at {}\n\n"
        "Possible solutions:\n"
        "  1. Check if the API server is running\n"
        "  2. Verify the endpoint URL in your config file\n"
        "  3. Check your network connection\n"
        "  4. If using a custom endpoint, ensure it's accessible",
        endpoint);
}

Result<std::vector<RemoteFile>> HttpStoreClient::parse_file_list(const std::string& body) {
    using R = Result<std::vector<RemoteFile>>;

    Json::Value root;
    std::string errs;
    if (!parse_json(body, root, errs)) {
        return R::Err("Invalid JSON in file listing: " + errs);
    }

    const Json::Value* items = &root;
    if (root.isObject()) {
        items = &root["files"];
        if (items->isNull()) return R::Ok({});
    }
    if (!items->isArray()) {
        return R::Err("Unexpected file listing shape (expected an array of files)");
    }

    std::vector<RemoteFile> files;
    files.reserve(items->size());
    for (Json::Value::ArrayIndex i = 0; i < items->size(); ++i) {
        const Json::Value& item = (*items)[i];
        if (!item.isObject()) continue;

        RemoteFile rf;
        rf.name = json_string(item, "name");
        rf.display_name = json_string(item, "displayName");
        rf.original_name = json_string(item, "originalDisplayName");
        if (rf.original_name.empty()) rf.original_name = rf.display_name;
        std::string sha = json_string(item, "sha256");
        if (!sha.empty()) rf.sha256 = to_lower(sha);
        rf.state = json_string(item, "state");
        files.push_back(std::move(rf));
    }
    return R::Ok(std::move(files));
}

RemoteResult<HttpStoreClient::Response> HttpStoreClient::perform(Method method,
                                                                 const std::string& path,
                                                                 const Upload* upload,
                                                                 const CancellationToken* token) {
    using R = RemoteResult<Response>;
    const char* verb = method == Method::Get ? "GET" : method == Method::Post ? "POST" : "DELETE";

    if (curl_global().init_rc != CURLE_OK) {
        return R::Err({RemoteError::Kind::Connection, 0,
                       std::string("libcurl init failed: ") + curl_easy_strerror(curl_global().init_rc)});
    }
    if (token && token->is_cancelled()) {
        return R::Err({RemoteError::Kind::Cancelled, 0, "Operation cancelled by user"});
    }

    EasyPtr easy(curl_easy_init());
    if (!easy) {
        return R::Err({RemoteError::Kind::Transient, 0, "curl_easy_init failed"});
    }
    CURL* h = easy.get();

    std::string url = base_url_ + path;
    Response response;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_));
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xfer_progress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(token));

    curl_slist* raw_headers = curl_slist_append(nullptr, "Accept: application/json");
    if (token_) {
        raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + *token_).c_str());
    }
    SlistPtr headers(raw_headers);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

    MimePtr mime;
    if (method == Method::Delete) {
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
    } else if (method == Method::Post && upload) {
        mime.reset(curl_mime_init(h));
        curl_mimepart* file_part = curl_mime_addpart(mime.get());
        curl_mime_name(file_part, "file");
        if (curl_mime_filedata(file_part, upload->path.c_str()) != CURLE_OK) {
            return R::Err({RemoteError::Kind::Client, 0, "Cannot read " + upload->path});
        }
        curl_mime_filename(file_part, upload->filename.c_str());
        curl_mime_type(file_part, "application/octet-stream");

        curl_mimepart* config_part = curl_mime_addpart(mime.get());
        curl_mime_name(config_part, "config");
        curl_mime_data(config_part, upload->config_json.c_str(), CURL_ZERO_TERMINATED);
        curl_mime_type(config_part, "application/json");

        curl_easy_setopt(h, CURLOPT_MIMEPOST, mime.get());
    }

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        RemoteError err{classify_curl_code(rc), 0, detail};
        if (err.kind == RemoteError::Kind::Cancelled) {
            err.message = "Operation cancelled by user";
        }
        gemindex_log(fmt::format("http: {} {} failed: curl {} ({}) -> {}",
                                 verb, path, static_cast<int>(rc), detail,
                                 remote_error_kind_name(err.kind)));
        return R::Err(std::move(err));
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    gemindex_log(fmt::format("http: {} {} -> {}", verb, path, response.status));
    return R::Ok(std::move(response));
}

RemoteResult<std::vector<RemoteFile>> HttpStoreClient::list_files(const std::string& store) {
    using R = RemoteResult<std::vector<RemoteFile>>;

    auto res = perform(Method::Get, fmt::format(API_STORE_FILES, url_encode(store)), nullptr, nullptr);
    if (res.is_err()) return R::Err(res.error);

    const Response& resp = res.value;
    if (resp.status < 200 || resp.status >= 300) {
        return R::Err({classify_http_status(resp.status), resp.status,
                       "Failed to list files: " + error_message(resp.body, resp.status)});
    }

    auto parsed = parse_file_list(resp.body);
    if (parsed.is_err()) {
        return R::Err({RemoteError::Kind::Transient, resp.status, parsed.error});
    }
    return R::Ok(std::move(parsed.value));
}

RemoteResult<void> HttpStoreClient::upload_file(const std::string& store,
                                                const LocalFile& file,
                                                const std::string& display_name,
                                                const CancellationToken& token) {
    Json::Value config(Json::objectValue);
    config["displayName"] = display_name;
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";

    Upload upload;
    upload.path = file.absolute_path;
    upload.filename = display_name;
    upload.config_json = Json::writeString(writer, config);

    auto res = perform(Method::Post, fmt::format(API_STORE_FILES, url_encode(store)), &upload, &token);
    if (res.is_err()) return RemoteResult<void>::Err(res.error);

    const Response& resp = res.value;
    if (resp.status < 200 || resp.status >= 300) {
        return RemoteResult<void>::Err({classify_http_status(resp.status), resp.status,
                                        error_message(resp.body, resp.status)});
    }
    return RemoteResult<void>::Ok();
}

RemoteResult<void> HttpStoreClient::delete_file(const std::string& store,
                                                const std::string& remote_name,
                                                const CancellationToken& token) {
    auto res = perform(Method::Delete,
                       fmt::format(API_STORE_FILE, url_encode(store), url_encode(remote_name)),
                       nullptr, &token);
    if (res.is_err()) return RemoteResult<void>::Err(res.error);

    const Response& resp = res.value;
    // Already gone counts as deleted
    if (resp.status == 404 || (resp.status >= 200 && resp.status < 300)) {
        return RemoteResult<void>::Ok();
    }
    return RemoteResult<void>::Err({classify_http_status(resp.status), resp.status,
                                    "Failed to delete file: " + error_message(resp.body, resp.status)});
}
