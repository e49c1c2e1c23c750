#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "media_subject.hpp"

class Logger;

// Remote media-library record the handlers keep in sync. Every method throws
// CatalogError on any non-success outcome.
class CatalogClient {
public:
  virtual ~CatalogClient() = default;

  virtual MediaSubject fetch_subject(std::int64_t id) = 0;
  virtual void update_location(std::int64_t id,
                               const std::filesystem::path& new_folder,
                               const std::filesystem::path& new_root) = 0;
  virtual void rescan(std::int64_t id) = 0;
};

struct CatalogEndpoint {
  std::string host = "localhost";
  unsigned short port = 7878;
  std::string api_key;
  std::string api_base = "/api/v3";
  std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
  int status = 0;
  std::string body;
};

// Radarr v3 REST API over plain HTTP/1.0.
class RadarrCatalogClient : public CatalogClient {
public:
  RadarrCatalogClient(CatalogEndpoint endpoint, std::shared_ptr<Logger> logger);

  MediaSubject fetch_subject(std::int64_t id) override;
  void update_location(std::int64_t id,
                       const std::filesystem::path& new_folder,
                       const std::filesystem::path& new_root) override;
  void rescan(std::int64_t id) override;

private:
  nlohmann::json get_movie(std::int64_t id);
  nlohmann::json call(const std::string& method,
                      const std::string& path,
                      const nlohmann::json* body);
  HttpResponse send(const std::string& method,
                    const std::string& target,
                    const std::string& body);

  CatalogEndpoint endpoint_;
  std::shared_ptr<Logger> logger_;
};
