#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  Precondition,
  Transform,
  Corruption,
  Catalog,
  Cancelled,
  Internal
};

inline const char* to_string(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Precondition: return "precondition";
    case ErrorKind::Transform:    return "transform";
    case ErrorKind::Corruption:   return "corruption";
    case ErrorKind::Catalog:      return "catalog";
    case ErrorKind::Cancelled:    return "cancelled";
    case ErrorKind::Internal:     return "internal";
  }
  return "internal";
}

class MoverError : public std::runtime_error {
public:
  MoverError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Bad input or state; nothing was started.
class PreconditionError : public MoverError {
public:
  explicit PreconditionError(const std::string& message)
    : MoverError(ErrorKind::Precondition, message) {}
};

// External tool failed or produced nothing usable.
class TransformError : public MoverError {
public:
  explicit TransformError(const std::string& message)
    : MoverError(ErrorKind::Transform, message) {}
};

// Digest mismatch. The safe transfer routines have already rolled back.
class CorruptionError : public MoverError {
public:
  explicit CorruptionError(const std::string& message)
    : MoverError(ErrorKind::Corruption, "Corruption detected: " + message) {}
};

// Remote catalog refused or was unreachable. Local files are left as they are.
class CatalogError : public MoverError {
public:
  explicit CatalogError(const std::string& message)
    : MoverError(ErrorKind::Catalog, message) {}
};

class CancelledError : public MoverError {
public:
  explicit CancelledError(const std::string& message)
    : MoverError(ErrorKind::Cancelled, message) {}
};
