#pragma once

#include <filesystem>
#include <memory>

#include "operation_handler.hpp"

class CatalogClient;
class Logger;
class SafeTransfer;

// Relocates a media file from the fast tier to the slow tier and points the
// catalog at the new folder.
class CopyOperation : public OperationHandler {
public:
  struct Options {
    std::filesystem::path fast_root;
    std::filesystem::path slow_root;
  };

  CopyOperation(Options options,
                std::shared_ptr<SafeTransfer> transfer,
                std::shared_ptr<CatalogClient> catalog,
                std::shared_ptr<Logger> logger);

  void execute(const MediaSubject& subject,
               const StatusCallback& update_status,
               const ProgressCallback& update_progress) override;

  // slow_root / (source relative to fast_root); PreconditionError otherwise.
  static std::filesystem::path destination_for(const std::filesystem::path& source,
                                               const std::filesystem::path& fast_root,
                                               const std::filesystem::path& slow_root);

  // A folder location resolves to the largest regular file inside it.
  static std::filesystem::path resolve_media_file(const std::filesystem::path& location);

private:
  Options options_;
  std::shared_ptr<SafeTransfer> transfer_;
  std::shared_ptr<CatalogClient> catalog_;
  std::shared_ptr<Logger> logger_;
};
