#include "safe_transfer.hpp"

#include <cerrno>
#include <exception>
#include <system_error>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

class FileDescriptor {
public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() { if(fd_ >= 0) ::close(fd_); }
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int get() const { return fd_; }

  void close_checked(const fs::path& path) {
    int fd = fd_;
    fd_ = -1;
    if(::close(fd) != 0) {
      throw std::system_error(errno, std::generic_category(), "close " + path.string());
    }
  }

private:
  int fd_;
};

void write_all(int fd, const unsigned char* data, std::size_t size, const fs::path& path) {
  while(size > 0) {
    ssize_t n = ::write(fd, data, size);
    if(n < 0) {
      if(errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "write " + path.string());
    }
    data += n;
    size -= static_cast<std::size_t>(n);
  }
}

void remove_quietly(const fs::path& path, Logger* logger) {
  std::error_code ec;
  fs::remove(path, ec);
  if(ec) {
    log_warn(logger, "Unable to remove {}: {}", path.string(), ec.message());
  }
}

} // namespace

SafeTransfer::SafeTransfer(ChecksumEngine checksum, std::shared_ptr<Logger> logger)
  : checksum_(std::move(checksum)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("safe-transfer")) {}

fs::path SafeTransfer::backup_path(const fs::path& original) {
  fs::path backup = original;
  backup += ".backup";
  return backup;
}

std::string SafeTransfer::digest_with_progress(const fs::path& path,
                                               const char* label,
                                               const TransferOptions& options) const {
  ChecksumEngine::Progress progress;
  if(options.progress) {
    progress = [&](int percent){
      options.progress(fmt::format("{} {}%", label, percent));
    };
  }
  return checksum_.digest(path, progress);
}

void SafeTransfer::copy_file_contents(const fs::path& src,
                                      const fs::path& dst,
                                      const TransferOptions& options) const {
  FileDescriptor in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
  if(in.get() < 0) {
    throw std::system_error(errno, std::generic_category(), "open " + src.string());
  }
  struct stat st{};
  if(::fstat(in.get(), &st) != 0) {
    throw std::system_error(errno, std::generic_category(), "stat " + src.string());
  }

  FileDescriptor out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
  if(out.get() < 0) {
    throw std::system_error(errno, std::generic_category(), "open " + dst.string());
  }
  ::posix_fadvise(in.get(), 0, 0, POSIX_FADV_SEQUENTIAL);

  const auto total = static_cast<unsigned long long>(st.st_size);
  std::vector<unsigned char> buffer(checksum_.block_size());
  unsigned long long copied = 0;
  int last_percent = -1;
  for(;;) {
    ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
    if(n < 0) {
      if(errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "read " + src.string());
    }
    if(n == 0) break;
    write_all(out.get(), buffer.data(), static_cast<std::size_t>(n), dst);
    copied += static_cast<unsigned long long>(n);
    if(options.progress) {
      int percent = total > 0 ? static_cast<int>(copied * 100 / total) : 100;
      if(percent != last_percent) {
        last_percent = percent;
        options.progress(fmt::format("{}% ({}/{} MiB)", percent,
                                     format_mib(copied), format_mib(total)));
      }
    }
  }

  if(::fsync(out.get()) != 0) {
    throw std::system_error(errno, std::generic_category(), "fsync " + dst.string());
  }
  if(::fchmod(out.get(), st.st_mode & 07777) != 0) {
    log_warn(logger_.get(), "Unable to copy permissions onto {}", dst.string());
  }
  struct timespec times[2] = {st.st_atim, st.st_mtim};
  if(::futimens(out.get(), times) != 0) {
    log_warn(logger_.get(), "Unable to copy timestamps onto {}", dst.string());
  }
  out.close_checked(dst);
}

void SafeTransfer::copy_file(const fs::path& src,
                             const fs::path& dst,
                             const TransferOptions& options) const {
  if(!options.background_priority) {
    copy_file_contents(src, dst, options);
    return;
  }

  // Priority cannot be raised back without privilege, so the low priority
  // copy gets its own thread.
  std::exception_ptr failure;
  std::thread worker([&]{
    std::string error;
    if(!enter_background_priority(error)) {
      log_warn(logger_.get(), "Background priority unavailable ({}), copying at normal priority", error);
    }
    try {
      copy_file_contents(src, dst, options);
    } catch(...) {
      failure = std::current_exception();
    }
  });
  worker.join();
  if(failure) {
    std::rethrow_exception(failure);
  }
}

void SafeTransfer::safe_copy(const fs::path& src,
                             const fs::path& dst,
                             const TransferOptions& options) const {
  if(!fs::is_regular_file(src)) {
    throw PreconditionError("Source file not found: " + src.string());
  }
  if(fs::exists(dst) && fs::equivalent(src, dst)) {
    throw PreconditionError("Source and destination are the same file: " + src.string());
  }

  log_info(logger_.get(), "Copying {} -> {}", src.string(), dst.string());
  const auto source_digest = digest_with_progress(src, "Checksumming source", options);

  if(dst.has_parent_path()) {
    fs::create_directories(dst.parent_path());
  }

  std::string written_digest;
  try {
    copy_file(src, dst, options);
    if(options.after_copy) {
      options.after_copy(dst);
    }
    written_digest = digest_with_progress(dst, "Verifying", options);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Copy to {} failed: {}", dst.string(), e.what());
    remove_quietly(dst, logger_.get());
    throw;
  }

  if(written_digest != source_digest) {
    remove_quietly(dst, logger_.get());
    log_error(logger_.get(), "Digest mismatch for {} ({} != {})",
              dst.string(), written_digest, source_digest);
    throw CorruptionError("checksum mismatch after copying " + src.string() +
                          " to " + dst.string() + "; destination removed");
  }
  log_info(logger_.get(), "Verified {} ({} {})", dst.string(), checksum_.algorithm(), written_digest);
}

void SafeTransfer::safe_replace(const fs::path& original,
                                const fs::path& replacement,
                                const TransferOptions& options) const {
  if(!fs::is_regular_file(original)) {
    throw PreconditionError("File to replace not found: " + original.string());
  }
  if(!fs::is_regular_file(replacement)) {
    throw PreconditionError("Replacement file not found: " + replacement.string());
  }
  const auto backup = backup_path(original);
  if(fs::exists(backup)) {
    throw PreconditionError("Stale backup " + backup.string() +
                            " exists; resolve it before replacing " + original.string());
  }

  const auto original_mode = fs::status(original).permissions();
  log_info(logger_.get(), "Replacing {} with {}", original.string(), replacement.string());
  const auto intended_digest = digest_with_progress(replacement, "Checksumming replacement", options);

  fs::rename(original, backup);

  auto restore = [&]{
    std::error_code ec;
    fs::remove(original, ec);
    fs::rename(backup, original, ec);
    if(ec) {
      log_error(logger_.get(), "Unable to restore {} from {}: {}",
                original.string(), backup.string(), ec.message());
    } else {
      log_warn(logger_.get(), "Restored {} from backup", original.string());
    }
  };

  std::string written_digest;
  try {
    copy_file(replacement, original, options);
    if(options.after_copy) {
      options.after_copy(original);
    }
    written_digest = digest_with_progress(original, "Verifying", options);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Replacing {} failed: {}", original.string(), e.what());
    restore();
    throw;
  }

  if(written_digest != intended_digest) {
    restore();
    throw CorruptionError("checksum mismatch after replacing " + original.string() +
                          "; original content restored");
  }

  remove_quietly(backup, logger_.get());
  std::error_code ec;
  fs::permissions(original, original_mode, fs::perm_options::replace, ec);
  if(ec) {
    log_warn(logger_.get(), "Unable to restore permissions on {}: {}", original.string(), ec.message());
  }
  log_info(logger_.get(), "Replaced {} ({} {})", original.string(), checksum_.algorithm(), written_digest);
}
