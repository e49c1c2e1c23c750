#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

// Streams a file through a content digest in large blocks. XXH3_128 is the
// default; any OpenSSL digest name (SHA256, MD5, ...) is accepted when a
// cryptographic check is wanted.
class ChecksumEngine {
public:
  using Progress = std::function<void(int percent)>;

  static constexpr const char* kDefaultAlgorithm = "XXH3_128";
  static constexpr std::size_t kDefaultBlockSize = 8 * 1024 * 1024;

  explicit ChecksumEngine(std::string algorithm = kDefaultAlgorithm,
                          std::size_t block_size = kDefaultBlockSize);

  // Lowercase hex token. Read errors surface as std::system_error; a raised
  // `stop` flag aborts between blocks with CancelledError.
  std::string digest(const std::filesystem::path& path,
                     const Progress& progress = {},
                     const std::atomic<bool>* stop = nullptr) const;

  const std::string& algorithm() const { return algorithm_; }
  std::size_t block_size() const { return block_size_; }

private:
  std::string algorithm_;
  std::size_t block_size_;
};
