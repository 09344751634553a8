#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

class CancellationToken;

// Classified failure of a remote call. The adapter decides the kind where
// the error originates; callers branch on kind only.
struct RemoteError {
    enum class Kind {
        Client,       // request rejected (4xx other than 408/429); never retried
        Transient,    // 5xx, 408, 429, dropped transfer; retryable
        Connection,   // cannot reach the endpoint at all
        Cancelled,    // aborted through the cancellation token
    };

    Kind kind = Kind::Transient;
    long http_status = 0;   // 0 when no HTTP response was received
    std::string message;
};

const char* remote_error_kind_name(RemoteError::Kind kind);

// Result of a remote call, mirroring Result<T>
template <typename T>
struct RemoteResult {
    bool success;
    T value;
    RemoteError error;

    static RemoteResult<T> Ok(T val) {
        return {true, std::move(val), {}};
    }

    static RemoteResult<T> Err(RemoteError err) {
        return {false, T{}, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

template <>
struct RemoteResult<void> {
    bool success;
    RemoteError error;

    static RemoteResult<void> Ok() {
        return {true, {}};
    }

    static RemoteResult<void> Err(RemoteError err) {
        return {false, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote document store holding the synced copies
class RemoteStoreClient {
public:
    virtual ~RemoteStoreClient() = default;

    virtual RemoteResult<std::vector<RemoteFile>> list_files(const std::string& store) = 0;

    // Upload the file's bytes under `display_name` (the identity key)
    virtual RemoteResult<void> upload_file(const std::string& store,
                                           const LocalFile& file,
                                           const std::string& display_name,
                                           const CancellationToken& token) = 0;

    // Idempotent: an entry that no longer exists counts as deleted
    virtual RemoteResult<void> delete_file(const std::string& store,
                                           const std::string& remote_name,
                                           const CancellationToken& token) = 0;
};
