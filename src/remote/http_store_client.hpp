#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include "remote_store.hpp"

// RemoteStoreClient over the store's HTTP API (libcurl, jsoncpp).
//
//   GET    {endpoint}/api/stores/{store}/files
//   POST   {endpoint}/api/stores/{store}/files         multipart: file + config
//   DELETE {endpoint}/api/stores/{store}/files/{name}
//
// Each call runs on its own easy handle, so one client can be shared by
// every worker thread. In-flight transfers poll the cancellation token from
// libcurl's progress callback and abort when it fires.
class HttpStoreClient : public RemoteStoreClient {
public:
    explicit HttpStoreClient(const ApiConfig& api);

    RemoteResult<std::vector<RemoteFile>> list_files(const std::string& store) override;

    RemoteResult<void> upload_file(const std::string& store,
                                   const LocalFile& file,
                                   const std::string& display_name,
                                   const CancellationToken& token) override;

    RemoteResult<void> delete_file(const std::string& store,
                                   const std::string& remote_name,
                                   const CancellationToken& token) override;

    const std::string& base_url() const { return base_url_; }

    // Accepts {"files":[...]} or a bare array
    static Result<std::vector<RemoteFile>> parse_file_list(const std::string& body);

    // 408, 429 and 5xx are retryable; any other 4xx is the caller's fault
    static RemoteError::Kind classify_http_status(long status);

    // `message` field of a JSON error body, else "Unknown error (HTTP n)"
    static std::string error_message(const std::string& body, long status);

    // Troubleshooting text printed when the endpoint cannot be reached
    static std::string connection_hints(const std::string& endpoint);

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    enum class Method { Get, Post, Delete };

    // Upload payload; only set for POST
    struct Upload {
        std::string path;
        std::string filename;
        std::string config_json;
    };

    RemoteResult<Response> perform(Method method,
                                   const std::string& path,
                                   const Upload* upload,
                                   const CancellationToken* token);

    std::string base_url_;
    std::optional<std::string> token_;
    int connect_timeout_;
};
