#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "media_subject.hpp"

inline constexpr const char* kCopyOperation = "copy";
inline constexpr const char* kConvertOperation = "convert";

// Handlers report their own sub-states ("copying", "updating", ...) through
// `status` and free text through `progress`. Failures are thrown.
using StatusCallback = std::function<void(const std::string& status)>;
using ProgressCallback = std::function<void(const std::string& progress)>;

class OperationHandler {
public:
  virtual ~OperationHandler() = default;

  virtual void execute(const MediaSubject& subject,
                       const StatusCallback& update_status,
                       const ProgressCallback& update_progress) = 0;
};

// Operation type to handler. Fixed at construction, so the worker and the
// console read it without locking.
class HandlerRegistry {
public:
  using Map = std::map<std::string, std::shared_ptr<OperationHandler>>;

  explicit HandlerRegistry(Map handlers) : handlers_(std::move(handlers)) {}

  std::shared_ptr<OperationHandler> find(const std::string& operation_type) const {
    auto it = handlers_.find(operation_type);
    return it == handlers_.end() ? nullptr : it->second;
  }

  bool contains(const std::string& operation_type) const {
    return find(operation_type) != nullptr;
  }

  std::vector<std::string> types() const {
    std::vector<std::string> out;
    for(const auto& entry : handlers_) out.push_back(entry.first);
    return out;
  }

private:
  const std::map<std::string, std::shared_ptr<OperationHandler>> handlers_;
};
