#include "catalog_client.hpp"

#include <asio.hpp>

#include <sstream>
#include <system_error>

#include "errors.hpp"
#include "log.hpp"

using asio::ip::tcp;

namespace {

HttpResponse parse_response(const std::string& raw, const std::string& target) {
  auto header_end = raw.find("\r\n\r\n");
  if(header_end == std::string::npos) {
    throw CatalogError("Malformed HTTP response from catalog for " + target);
  }
  std::istringstream status_line(raw.substr(0, raw.find("\r\n")));
  std::string version;
  HttpResponse response;
  status_line >> version >> response.status;
  if(version.rfind("HTTP/", 0) != 0 || response.status == 0) {
    throw CatalogError("Malformed HTTP status line from catalog for " + target);
  }
  response.body = raw.substr(header_end + 4);
  return response;
}

} // namespace

RadarrCatalogClient::RadarrCatalogClient(CatalogEndpoint endpoint, std::shared_ptr<Logger> logger)
  : endpoint_(std::move(endpoint)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("catalog")) {}

HttpResponse RadarrCatalogClient::send(const std::string& method,
                                       const std::string& target,
                                       const std::string& body) {
  asio::io_context io;
  tcp::resolver resolver(io);
  tcp::socket socket(io);

  std::ostringstream request;
  request << method << " " << target << " HTTP/1.0\r\n"
          << "Host: " << endpoint_.host << ":" << endpoint_.port << "\r\n"
          << "X-Api-Key: " << endpoint_.api_key << "\r\n"
          << "Accept: application/json\r\n";
  if(!body.empty()) {
    request << "Content-Type: application/json\r\n"
            << "Content-Length: " << body.size() << "\r\n";
  }
  request << "Connection: close\r\n\r\n" << body;
  const std::string request_text = request.str();

  std::string raw;
  std::error_code failure;
  bool finished = false;

  resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
    [&](const std::error_code& ec, tcp::resolver::results_type endpoints) {
      if(ec) { failure = ec; finished = true; return; }
      asio::async_connect(socket, endpoints,
        [&](const std::error_code& ec, const tcp::endpoint&) {
          if(ec) { failure = ec; finished = true; return; }
          asio::async_write(socket, asio::buffer(request_text),
            [&](const std::error_code& ec, std::size_t) {
              if(ec) { failure = ec; finished = true; return; }
              asio::async_read(socket, asio::dynamic_buffer(raw),
                [&](const std::error_code& ec, std::size_t) {
                  if(ec && ec != asio::error::eof) failure = ec;
                  finished = true;
                });
            });
        });
    });

  io.run_for(endpoint_.timeout);
  if(!finished) {
    std::error_code ignored;
    socket.close(ignored);
    throw CatalogError(method + " " + target + " timed out after " +
                       std::to_string(endpoint_.timeout.count()) + " ms");
  }
  if(failure) {
    throw CatalogError(method + " " + target + " failed: " + failure.message());
  }
  return parse_response(raw, target);
}

nlohmann::json RadarrCatalogClient::call(const std::string& method,
                                         const std::string& path,
                                         const nlohmann::json* body) {
  const std::string target = endpoint_.api_base + path;
  log_debug(logger_.get(), "{} {}", method, target);
  auto response = send(method, target, body ? body->dump() : std::string());
  if(response.status < 200 || response.status >= 300) {
    std::string detail = response.body.substr(0, 200);
    throw CatalogError("Catalog " + method + " " + target + " returned HTTP " +
                       std::to_string(response.status) +
                       (detail.empty() ? std::string() : ": " + detail));
  }
  if(response.body.empty()) return nlohmann::json();
  try {
    return nlohmann::json::parse(response.body);
  } catch(const nlohmann::json::parse_error& e) {
    throw CatalogError("Catalog " + method + " " + target + " returned invalid JSON: " + e.what());
  }
}

nlohmann::json RadarrCatalogClient::get_movie(std::int64_t id) {
  auto movie = call("GET", "/movie/" + std::to_string(id), nullptr);
  if(!movie.is_object()) {
    throw CatalogError("Catalog returned no record for movie " + std::to_string(id));
  }
  return movie;
}

MediaSubject RadarrCatalogClient::fetch_subject(std::int64_t id) {
  return subject_from_json(get_movie(id));
}

void RadarrCatalogClient::update_location(std::int64_t id,
                                          const std::filesystem::path& new_folder,
                                          const std::filesystem::path& new_root) {
  auto movie = get_movie(id);
  movie["path"] = new_folder.string();
  movie["rootFolderPath"] = new_root.string();
  log_info(logger_.get(), "Pointing movie {} at {} (root {})", id, new_folder.string(), new_root.string());
  call("PUT", "/movie/" + std::to_string(id), &movie);
}

void RadarrCatalogClient::rescan(std::int64_t id) {
  nlohmann::json command = {{"name", "RescanMovie"}, {"movieId", id}};
  log_info(logger_.get(), "Requesting rescan of movie {}", id);
  call("POST", "/command", &command);
}
