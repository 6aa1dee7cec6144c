#pragma once
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace treemirror {

enum class ErrorKind : std::uint8_t { Traversal, Structure, Deletion, Reconcile, Configuration };

auto to_string(ErrorKind kind) -> std::string_view;

/**
 * Base of every error the engine raises.
 * what() reads "<Kind>Error: <operation> <path>: <cause>" so a single log
 * line is enough to diagnose the failure.
 */
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, std::string_view operation, std::filesystem::path path,
        std::error_code cause = {});
  Error(ErrorKind kind, std::string_view operation, std::filesystem::path path,
        std::string_view detail);

  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::error_code code() const { return code_; }

private:
  ErrorKind kind_;
  std::filesystem::path path_;
  std::error_code code_;
};

// Source root or a source subdirectory could not be listed
class TraversalError : public Error {
public:
  TraversalError(std::string_view op, std::filesystem::path p, std::error_code ec = {})
      : Error(ErrorKind::Traversal, op, std::move(p), ec) {}
};

// A replica directory could not be created or is not a directory
class StructureError : public Error {
public:
  StructureError(std::string_view op, std::filesystem::path p, std::error_code ec = {})
      : Error(ErrorKind::Structure, op, std::move(p), ec) {}
  StructureError(std::string_view op, std::filesystem::path p, std::string_view detail)
      : Error(ErrorKind::Structure, op, std::move(p), detail) {}
};

// A stale replica entry could not be removed
class DeletionError : public Error {
public:
  DeletionError(std::string_view op, std::filesystem::path p, std::error_code ec = {})
      : Error(ErrorKind::Deletion, op, std::move(p), ec) {}
};

// A replica file could not be created, hashed or replaced
class ReconcileError : public Error {
public:
  ReconcileError(std::string_view op, std::filesystem::path p, std::error_code ec = {})
      : Error(ErrorKind::Reconcile, op, std::move(p), ec) {}
  ReconcileError(std::string_view op, std::filesystem::path p, std::string_view detail)
      : Error(ErrorKind::Reconcile, op, std::move(p), detail) {}
};

// Invalid settings; fatal before the first pass
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(std::string_view detail)
      : Error(ErrorKind::Configuration, "configure", {}, detail) {}
  ConfigurationError(std::string_view detail, std::filesystem::path p)
      : Error(ErrorKind::Configuration, "configure", std::move(p), detail) {}
};

} // namespace treemirror
