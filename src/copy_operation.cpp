#include "copy_operation.hpp"

#include <cstdint>
#include <stdexcept>

#include "catalog_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "safe_transfer.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

CopyOperation::CopyOperation(Options options,
                             std::shared_ptr<SafeTransfer> transfer,
                             std::shared_ptr<CatalogClient> catalog,
                             std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    transfer_(std::move(transfer)),
    catalog_(std::move(catalog)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("copy")) {
  if(!transfer_ || !catalog_) {
    throw std::invalid_argument("CopyOperation needs a transfer engine and a catalog client");
  }
}

fs::path CopyOperation::destination_for(const fs::path& source,
                                        const fs::path& fast_root,
                                        const fs::path& slow_root) {
  if(fast_root.empty() || slow_root.empty()) {
    throw PreconditionError("fast_root and slow_root must both be configured");
  }
  auto relative = relative_under(source, fast_root);
  if(!relative) {
    throw PreconditionError("Source path " + source.string() +
                            " is not under the fast root folder " + fast_root.string());
  }
  return slow_root.lexically_normal() / *relative;
}

fs::path CopyOperation::resolve_media_file(const fs::path& location) {
  std::error_code ec;
  if(fs::is_regular_file(location, ec)) return location;
  if(!fs::is_directory(location, ec)) {
    throw PreconditionError("Media file not found: " + location.string());
  }
  fs::path best;
  std::uintmax_t best_size = 0;
  for(const auto& entry : fs::directory_iterator(location)) {
    if(!entry.is_regular_file()) continue;
    auto size = entry.file_size();
    if(best.empty() || size > best_size) {
      best = entry.path();
      best_size = size;
    }
  }
  if(best.empty()) {
    throw PreconditionError("No media file found in " + location.string());
  }
  return best;
}

void CopyOperation::execute(const MediaSubject& subject,
                            const StatusCallback& update_status,
                            const ProgressCallback& update_progress) {
  update_status("copying");
  update_progress("Copying file...");

  const auto source = resolve_media_file(subject.location);
  const auto destination = destination_for(source, options_.fast_root, options_.slow_root);
  logger_->info("Copying '{}': {} -> {}", subject.title, source.string(), destination.string());

  TransferOptions transfer_options;
  transfer_options.background_priority = true;
  transfer_options.progress = [&](const std::string& text) {
    update_progress("Copying: " + text);
  };
  transfer_->safe_copy(source, destination, transfer_options);

  update_status("updating");
  update_progress("Updating catalog...");
  const auto new_folder = destination.parent_path();
  try {
    catalog_->update_location(subject.id, new_folder, options_.slow_root);
    catalog_->rescan(subject.id);
  } catch(const CatalogError& e) {
    // The verified copy stays in place for manual reconciliation.
    throw CatalogError(std::string(e.what()) + " (file already copied to " +
                       destination.string() + ")");
  }
  logger_->info("Catalog now points movie {} at {}", subject.id, new_folder.string());
}
