#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "digest.hpp"

class Logger;

struct TransferOptions {
  bool background_priority = false;
  // Human readable progress, e.g. "42% (420.0/1000.0 MiB)".
  std::function<void(const std::string&)> progress;
  // Runs after the bytes are written and before the verifying digest.
  std::function<void(const std::filesystem::path& written)> after_copy;
};

// Copy and replace with digest verification. On any failure the destination
// is either absent (safe_copy) or holds its previous content (safe_replace).
class SafeTransfer {
public:
  SafeTransfer(ChecksumEngine checksum, std::shared_ptr<Logger> logger);

  void safe_copy(const std::filesystem::path& src,
                 const std::filesystem::path& dst,
                 const TransferOptions& options = {}) const;

  // Rename original aside, copy replacement in, verify, then commit or roll back.
  void safe_replace(const std::filesystem::path& original,
                    const std::filesystem::path& replacement,
                    const TransferOptions& options = {}) const;

  static std::filesystem::path backup_path(const std::filesystem::path& original);

  const ChecksumEngine& checksum() const { return checksum_; }

private:
  void copy_file(const std::filesystem::path& src,
                 const std::filesystem::path& dst,
                 const TransferOptions& options) const;
  void copy_file_contents(const std::filesystem::path& src,
                          const std::filesystem::path& dst,
                          const TransferOptions& options) const;
  std::string digest_with_progress(const std::filesystem::path& path,
                                   const char* label,
                                   const TransferOptions& options) const;

  ChecksumEngine checksum_;
  std::shared_ptr<Logger> logger_;
};
