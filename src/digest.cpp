#include "digest.hpp"

#include <openssl/evp.h>
#include <xxhash.h>

#include <cerrno>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "errors.hpp"
#include "utils.hpp"

namespace {

struct FdCloser {
  int fd = -1;
  ~FdCloser() { if(fd >= 0) ::close(fd); }
};

bool is_xxh3_128(const std::string& algorithm) {
  return to_lower(algorithm) == "xxh3_128";
}

class BlockHasher {
public:
  virtual ~BlockHasher() = default;
  virtual void update(const unsigned char* data, std::size_t size) = 0;
  virtual std::vector<unsigned char> finish() = 0;
};

struct Xxh3StateDeleter {
  void operator()(XXH3_state_t* state) const { XXH3_freeState(state); }
};

class Xxh3Hasher : public BlockHasher {
public:
  Xxh3Hasher() : state_(XXH3_createState()) {
    if(!state_ || XXH3_128bits_reset(state_.get()) != XXH_OK) {
      throw std::runtime_error("Unable to initialise XXH3_128 digest");
    }
  }

  void update(const unsigned char* data, std::size_t size) override {
    if(XXH3_128bits_update(state_.get(), data, size) != XXH_OK) {
      throw std::runtime_error("XXH3_128 update failed");
    }
  }

  // Canonical (big-endian) form, the same bytes xxh128sum prints.
  std::vector<unsigned char> finish() override {
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, XXH3_128bits_digest(state_.get()));
    return std::vector<unsigned char>(canonical.digest, canonical.digest + sizeof(canonical.digest));
  }

private:
  std::unique_ptr<XXH3_state_t, Xxh3StateDeleter> state_;
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

class EvpHasher : public BlockHasher {
public:
  explicit EvpHasher(const std::string& algorithm) : ctx_(EVP_MD_CTX_new()) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if(!md || !ctx_ || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
      throw std::runtime_error("Unable to initialise " + algorithm + " digest");
    }
  }

  void update(const unsigned char* data, std::size_t size) override {
    if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
      throw std::runtime_error("Digest update failed");
    }
  }

  std::vector<unsigned char> finish() override {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
      throw std::runtime_error("Digest finalisation failed");
    }
    return std::vector<unsigned char>(digest, digest + length);
  }

private:
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx_;
};

std::unique_ptr<BlockHasher> make_hasher(const std::string& algorithm) {
  if(is_xxh3_128(algorithm)) return std::make_unique<Xxh3Hasher>();
  return std::make_unique<EvpHasher>(algorithm);
}

} // namespace

ChecksumEngine::ChecksumEngine(std::string algorithm, std::size_t block_size)
  : algorithm_(std::move(algorithm)),
    block_size_(block_size == 0 ? kDefaultBlockSize : block_size) {
  if(!is_xxh3_128(algorithm_) && EVP_get_digestbyname(algorithm_.c_str()) == nullptr) {
    throw PreconditionError("Unknown digest algorithm '" + algorithm_ + "'");
  }
}

std::string ChecksumEngine::digest(const std::filesystem::path& path,
                                   const Progress& progress,
                                   const std::atomic<bool>* stop) const {
  FdCloser file;
  file.fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if(file.fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open " + path.string());
  }
  struct stat st{};
  if(::fstat(file.fd, &st) != 0) {
    throw std::system_error(errno, std::generic_category(), "stat " + path.string());
  }
  const auto total = static_cast<unsigned long long>(st.st_size);

  auto hasher = make_hasher(algorithm_);

  ::posix_fadvise(file.fd, 0, 0, POSIX_FADV_SEQUENTIAL);

  std::vector<unsigned char> buffer(block_size_);
  unsigned long long consumed = 0;
  int last_percent = -1;
  for(;;) {
    if(stop && stop->load()) {
      throw CancelledError("Digest of " + path.string() + " cancelled");
    }
    ssize_t n = ::read(file.fd, buffer.data(), buffer.size());
    if(n < 0) {
      if(errno == EINTR) continue;
      throw std::system_error(errno, std::generic_category(), "read " + path.string());
    }
    if(n == 0) break;
    hasher->update(buffer.data(), static_cast<std::size_t>(n));
    consumed += static_cast<unsigned long long>(n);
    if(progress && total > 0) {
      int percent = static_cast<int>(consumed * 100 / total);
      if(percent > 100) percent = 100;
      if(percent != last_percent) {
        last_percent = percent;
        progress(percent);
      }
    }
  }
  if(progress && last_percent != 100) {
    progress(100);
  }

  return hex_from_bytes(hasher->finish());
}
