#include "remote_store.hpp"

const char* remote_error_kind_name(RemoteError::Kind kind) {
    switch (kind) {
        case RemoteError::Kind::Client:     return "client";
        case RemoteError::Kind::Transient:  return "transient";
        case RemoteError::Kind::Connection: return "connection";
        case RemoteError::Kind::Cancelled:  return "cancelled";
    }
    return "unknown";
}
