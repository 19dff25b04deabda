#pragma once

#include <cstdint>

constexpr const char* DEPSWEEP_VERSION = "0.4.0";

// ── Config directory layout ─────────────────────────────────
constexpr const char* CONFIG_DIR_NAME        = ".depsweep";
constexpr const char* CONFIG_DIR_ENV         = "DEPSWEEP_CONFIG_DIR";
constexpr const char* SKIP_PATHS_FILE        = "skip_paths";
constexpr const char* SENTINELS_FILE         = "sentinels";
constexpr const char* FIXED_PATHS_FILE       = "fixed_paths";   // optional, never created
constexpr const char* SETTINGS_FILE          = "config.yaml";   // optional, never created
constexpr const char* DEBUG_LOG_NAME         = "depsweep_debug.log";

// ── Exclusion backends ──────────────────────────────────────
constexpr const char* TMUTIL_BIN             = "tmutil";
constexpr const char* TMUTIL_EXCLUDED_TOKEN  = "[Excluded]";
constexpr const char* CACHEDIR_TAG_NAME      = "CACHEDIR.TAG";
constexpr const char* CACHEDIR_TAG_SIGNATURE = "Signature: 8a477f597d28d172789f06886806bc55";

// ── Walker ──────────────────────────────────────────────────
constexpr int DEFAULT_JOBS                   = 1;
constexpr int MAX_JOBS                       = 64;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK                        = 0;
constexpr int EXIT_FATAL                     = 1;
constexpr int EXIT_CANCELLED                 = 130;  // 128 + SIGINT
