#include "treemirror/error.hpp"

namespace treemirror {

namespace {

std::string compose(ErrorKind kind, std::string_view op, const std::filesystem::path &p,
                    std::string_view cause) {
  std::string s{to_string(kind)};
  s += "Error: ";
  s += op;
  if (!p.empty()) {
    s += ' ';
    s += p.string();
  }
  if (!cause.empty()) {
    s += ": ";
    s += cause;
  }
  return s;
}

} // namespace

std::string_view to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Traversal:
    return "Traversal";
  case ErrorKind::Structure:
    return "Structure";
  case ErrorKind::Deletion:
    return "Deletion";
  case ErrorKind::Reconcile:
    return "Reconcile";
  case ErrorKind::Configuration:
    return "Configuration";
  }
  return "Unknown";
}

Error::Error(ErrorKind kind, std::string_view operation, std::filesystem::path path,
             std::error_code cause)
    : std::runtime_error(compose(kind, operation, path, cause ? cause.message() : "")),
      kind_(kind), path_(std::move(path)), code_(cause) {}

Error::Error(ErrorKind kind, std::string_view operation, std::filesystem::path path,
             std::string_view detail)
    : std::runtime_error(compose(kind, operation, path, detail)), kind_(kind),
      path_(std::move(path)) {}

} // namespace treemirror
