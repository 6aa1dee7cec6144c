#pragma once
#include <cstddef>
#include <string_view>

namespace treemirror::consts {

// ---- Defaults ----
inline constexpr std::string_view kDefaultAlgorithm = "md5";
inline constexpr long kDefaultIntervalSeconds = 300;
inline constexpr long kMaxIntervalSeconds = 366L * 24 * 60 * 60;
inline constexpr std::string_view kDefaultLogLevel = "info";

// Staging files an update/create writes before the rename are named
// kStagingPrefix + 8 random hex digits
inline constexpr std::string_view kStagingPrefix = ".treemirror-";
inline constexpr int kStagingAttempts = 16;

// Read granularity when streaming a file through a digest or a copy
inline constexpr std::size_t kChunkSize = 64 * 1024;

// Checksum algorithms served by zlib instead of OpenSSL
inline constexpr std::string_view kAlgoCrc32   = "crc32";
inline constexpr std::string_view kAlgoAdler32 = "adler32";

// ---- Logging ----
inline constexpr std::string_view kLoggerName = "treemirror";
inline constexpr std::string_view kLogPattern = "%Y-%m-%d %H:%M:%S %l %v";

// ---- Settings file keys ----
inline constexpr std::string_view kKeySource    = "source:";
inline constexpr std::string_view kKeyReplica   = "replica:";
inline constexpr std::string_view kKeyLogFile   = "log_file:";
inline constexpr std::string_view kKeyInterval  = "interval:";
inline constexpr std::string_view kKeyAlgorithm = "algorithm:";
inline constexpr std::string_view kKeyLogLevel  = "log_level:";

} // namespace treemirror::consts
