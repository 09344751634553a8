#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// Present keys must convert; absent keys take the default
template <typename T>
static T get_or(const YAML::Node& node, const char* key, const T& fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return fallback;
    return value.as<T>();
}

// Scalar or sequence of scalars -> list of strings
static std::vector<std::string> parse_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node) return out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            if (item.IsScalar()) out.push_back(item.as<std::string>());
        }
    }
    return out;
}

static CollectConfig parse_collect_config(const YAML::Node& node) {
    CollectConfig collect;
    if (!node || !node.IsMap()) return collect;
    collect.include = parse_string_list(node["include"]);
    collect.exclude = parse_string_list(node["exclude"]);
    return collect;
}

static SyncSettings parse_sync_settings(const YAML::Node& node) {
    SyncSettings sync;
    if (!node || !node.IsMap()) return sync;
    sync.delete_remote = get_or<bool>(node, "delete", false);
    sync.concurrency = get_or<int>(node, "concurrency", DEFAULT_CONCURRENCY);
    sync.max_attempts = get_or<int>(node, "max_attempts", DEFAULT_MAX_ATTEMPTS);
    sync.retry_base_delay_ms = get_or<int>(node, "retry_base_delay_ms", DEFAULT_RETRY_BASE_DELAY_MS);
    sync.connection_failure_threshold =
        get_or<int>(node, "connection_failure_threshold", DEFAULT_CONNECTION_FAILURES);
    return sync;
}

static ApiConfig parse_api_config(const YAML::Node& node) {
    ApiConfig api;
    api.endpoint = DEFAULT_ENDPOINT;
    api.connect_timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
    if (!node || !node.IsMap()) return api;
    api.endpoint = get_or<std::string>(node, "endpoint", DEFAULT_ENDPOINT);
    api.token_env = get_or<std::string>(node, "token_env", "");
    api.connect_timeout = get_or<int>(node, "connect_timeout", DEFAULT_CONNECT_TIMEOUT_SECS);
    return api;
}

bool config_exists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

fs::path Config::get_default_config_path(const fs::path& dir) {
    return dir / DEFAULT_CONFIG_FILE;
}

Result<Config> Config::parse(const std::string& yaml_text, const fs::path& base_dir) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root.IsMap()) {
            return Result<Config>::Err("Config must be a YAML mapping");
        }

        int version = get_or<int>(root, "version", CONFIG_SCHEMA_VERSION);
        if (version != CONFIG_SCHEMA_VERSION) {
            return Result<Config>::Err(fmt::format("Unsupported config version {} (expected {})",
                                                   version, CONFIG_SCHEMA_VERSION));
        }

        config.store_ = get_or<std::string>(root, "store", "");
        config.collect_ = parse_collect_config(root["collect"]);
        config.sync_ = parse_sync_settings(root["sync"]);
        config.api_ = parse_api_config(root["api"]);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }

    config.base_dir_ = base_dir;

    if (!config.api_.token_env.empty()) {
        config.api_.token = platform::get_env(config.api_.token_env);
        if (!config.api_.token) {
            return Result<Config>::Err(fmt::format(
                "Environment variable {} (api.token_env) is not set", config.api_.token_env));
        }
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<Config>::Err(valid.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    if (!config_exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) abs = path;

    auto result = parse(buf.str(), abs.parent_path());
    if (result.is_ok()) {
        result.value.source_path_ = abs;
        gemindex_log(fmt::format("config: loaded {} (store={}, base={})", abs.string(),
                                 result.value.store_, result.value.base_dir_.string()));
    }
    return result;
}

Result<void> Config::validate() const {
    if (store_.empty()) {
        return Result<void>::Err("Missing required field: store");
    }
    if (collect_.include.empty()) {
        return Result<void>::Err("collect.include must list at least one pattern");
    }
    if (sync_.concurrency < 1) {
        return Result<void>::Err("sync.concurrency must be at least 1");
    }
    if (sync_.max_attempts < 1) {
        return Result<void>::Err("sync.max_attempts must be at least 1");
    }
    if (sync_.retry_base_delay_ms < 0) {
        return Result<void>::Err("sync.retry_base_delay_ms must not be negative");
    }
    if (sync_.connection_failure_threshold < 1) {
        return Result<void>::Err("sync.connection_failure_threshold must be at least 1");
    }
    if (api_.endpoint.empty()) {
        return Result<void>::Err("api.endpoint must not be empty");
    }
    if (api_.connect_timeout < 1) {
        return Result<void>::Err("api.connect_timeout must be at least 1 second");
    }
    return Result<void>::Ok();
}

Result<void> Config::apply_overrides(const ConfigOverrides& overrides) {
    if (overrides.store) store_ = *overrides.store;
    if (overrides.endpoint) api_.endpoint = *overrides.endpoint;
    if (overrides.concurrency) sync_.concurrency = *overrides.concurrency;
    if (overrides.force_delete) sync_.delete_remote = true;
    return validate();
}
