#pragma once
#include <memory>
#include <string>

#include "core/config/ServerConfig.hpp"

namespace httplib { class Server; }

namespace uds {

class UploadService;
class ArtifactCatalog;
class LocalFSBackend;

// JSON API over cpp-httplib: chunked upload, version query, update check and
// download of the current artifact.
class HttpServer {
public:
  HttpServer(UploadService& uploads,
             ArtifactCatalog& catalog,
             LocalFSBackend& fs,
             ServerConfig cfg);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Blocks until stop().
  bool listen(const std::string& host, int port);

  // For tests: bind an ephemeral port, then serve with listenAfterBind().
  int bindToAnyPort(const std::string& host);
  bool listenAfterBind();

  void stop();

private:
  void registerRoutes();

  UploadService& uploads_;
  ArtifactCatalog& catalog_;
  LocalFSBackend& fs_;
  ServerConfig cfg_;
  std::unique_ptr<httplib::Server> svr_;
};

// Start a blocking HTTP server on cfg.host:cfg.port.
void run_http_server(UploadService& uploads,
                     ArtifactCatalog& catalog,
                     LocalFSBackend& fs,
                     const ServerConfig& cfg);

} // namespace uds
