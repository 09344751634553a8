#pragma once

#include <cstddef>

// ── Version ─────────────────────────────────────────────────
constexpr const char* GEMINDEX_VERSION       = "0.1.0";
constexpr int CONFIG_SCHEMA_VERSION          = 1;

// ── Config defaults ─────────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_FILE    = ".gemindex.yml";
constexpr const char* DEFAULT_ENDPOINT       = "http://localhost:4000";

// ── Transfer defaults ───────────────────────────────────────
constexpr int DEFAULT_CONCURRENCY            = 8;     // Worker pool width
constexpr int DEFAULT_MAX_ATTEMPTS           = 3;     // Attempts per upload (first try included)
constexpr int DEFAULT_RETRY_BASE_DELAY_MS    = 1000;  // Backoff base: base * 2^(attempt-1)
constexpr int DEFAULT_CONNECTION_FAILURES    = 3;     // Consecutive connection failures before failing fast
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS   = 30;

// ── I/O ─────────────────────────────────────────────────────
constexpr std::size_t HASH_READ_BUF_SIZE     = 64 * 1024;
constexpr int PROMPT_POLL_MS                 = 100;   // stdin poll interval while confirming
constexpr int INTERRUPT_POLL_MS              = 50;    // signal watcher poll interval

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_CODE_OK                   = 0;
constexpr int EXIT_CODE_FAILURE              = 1;
constexpr int EXIT_CODE_CONFIG               = 2;
constexpr int EXIT_CODE_CANCELLED            = 130;   // 128 + SIGINT

// ── Remote API paths ────────────────────────────────────────
// Use fmt::format with these: fmt::format(API_STORE_FILES, encoded_store)
constexpr const char* API_STORE_FILES        = "/api/stores/{}/files";
constexpr const char* API_STORE_FILE         = "/api/stores/{}/files/{}";
