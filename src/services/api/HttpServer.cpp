#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

#include "core/Errors.hpp"
#include "core/Time.hpp"
#include "core/metadata/ArtifactCatalog.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/update/UpdateDecision.hpp"
#include "core/upload/UploadService.hpp"

using nlohmann::json;

namespace uds {

// -------- helpers --------

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response& res, int status, const std::string& msg) {
  send_json(res, status, json{{"error", msg}});
}

static int status_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:          return 400;
    case ErrorKind::IncompleteUpload:    return 400;
    case ErrorKind::SessionNotFound:     return 404;
    case ErrorKind::NotFound:            return 404;
    case ErrorKind::NoArtifactPublished: return 404;
    case ErrorKind::CorruptSession:      return 409;
    case ErrorKind::StorageFailure:      return 500;
  }
  return 500;
}

// Runs a handler body and turns every failure into a JSON error response.
template <typename Fn>
static void guarded(const httplib::Request& req, httplib::Response& res, Fn&& fn) {
  try {
    fn();
  } catch (const IncompleteUpload& e) {
    send_json(res, 400, json{{"error", "Not all chunks uploaded"},
                             {"receivedCount", e.received()},
                             {"totalChunks", e.total()}});
  } catch (const Error& e) {
    const int status = status_for(e.kind());
    if (status >= 500) spdlog::error("{} {}: {}", req.method, req.path, e.what());
    else spdlog::debug("{} {}: {} {}", req.method, req.path, to_string(e.kind()), e.what());
    send_error(res, status, e.what());
  } catch (const json::exception& e) {
    send_error(res, 400, std::string("invalid JSON: ") + e.what());
  } catch (const std::exception& e) {
    spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
    send_error(res, 500, "internal error");
  }
}

static json parse_object(const std::string& body) {
  if (body.empty()) return json::object();
  json j = json::parse(body);
  if (!j.is_object()) throw ValidationError("request body must be a JSON object");
  return j;
}

static std::string str_field(const json& j, const char* k) {
  if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
  return {};
}

static int64_t parse_int(const std::string& s, const char* name) {
  try {
    size_t pos = 0;
    long long v = std::stoll(s, &pos);
    if (pos == s.size()) return v;
  } catch (const std::exception&) {
  }
  throw ValidationError(std::string(name) + " must be an integer");
}

// Numbers and numeric strings are both accepted; absent means 0.
static int64_t int_field(const json& j, const char* k) {
  if (!j.contains(k) || j[k].is_null()) return 0;
  if (j[k].is_number_integer()) return j[k].get<int64_t>();
  if (j[k].is_string()) {
    const auto s = j[k].get<std::string>();
    return s.empty() ? 0 : parse_int(s, k);
  }
  throw ValidationError(std::string(k) + " must be an integer");
}

// Form field (multipart) first, then query string.
static std::string form_or_param(const httplib::Request& req, const char* k) {
  if (req.is_multipart_form_data() && req.has_file(k)) return req.get_file_value(k).content;
  if (req.has_param(k)) return req.get_param_value(k);
  return {};
}

static std::string session_id_from(const json& j) {
  std::string id = str_field(j, "sessionId");
  return id.empty() ? str_field(j, "fileId") : id;
}

static std::string quote_filename(const std::string& name) {
  std::string out;
  for (char c : name) {
    if (c == '"' || c == '\\') out.push_back('\\');
    if (c == '\r' || c == '\n') continue;
    out.push_back(c);
  }
  return out;
}

// -------- server --------

HttpServer::HttpServer(UploadService& uploads,
                       ArtifactCatalog& catalog,
                       LocalFSBackend& fs,
                       ServerConfig cfg)
  : uploads_(uploads), catalog_(catalog), fs_(fs), cfg_(std::move(cfg)),
    svr_(std::make_unique<httplib::Server>()) {
  // Multipart framing comes on top of the chunk itself.
  svr_->set_payload_max_length(static_cast<size_t>(cfg_.maxChunkBytes) + 64 * 1024);
  registerRoutes();
}

HttpServer::~HttpServer() = default;

void HttpServer::registerRoutes() {
  auto& svr = *svr_;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /api/upload/init
  // Body: {"fileName","fileSize","totalChunks","currentVersion","minVersion"}
  svr.Post("/api/upload/init", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const json j = parse_object(req.body);
      UploadRequest up;
      up.fileName       = str_field(j, "fileName");
      up.fileSize       = int_field(j, "fileSize");
      up.totalChunks    = int_field(j, "totalChunks");
      up.currentVersion = str_field(j, "currentVersion");
      up.minVersion     = str_field(j, "minVersion");

      const std::string id = uploads_.init(up);
      send_json(res, 200, json{{"sessionId", id}, {"message", "Upload session initialized"}});
    });
  });

  // POST /api/upload/chunk
  // multipart/form-data: sessionId (or fileId), chunkIndex, file field "chunk".
  // Any other content type: raw chunk bytes, ids in the query string.
  svr.Post("/api/upload/chunk", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      std::string sessionId = form_or_param(req, "sessionId");
      if (sessionId.empty()) sessionId = form_or_param(req, "fileId");
      const std::string indexStr = form_or_param(req, "chunkIndex");
      if (sessionId.empty() || indexStr.empty()) {
        throw ValidationError("sessionId and chunkIndex are required");
      }
      const int64_t chunkIndex = parse_int(indexStr, "chunkIndex");

      std::string multipartBytes;
      const bool multipart = req.is_multipart_form_data();
      if (multipart && req.has_file("chunk")) multipartBytes = req.get_file_value("chunk").content;
      const std::string& bytes = multipart ? multipartBytes : req.body;

      if (bytes.empty()) throw ValidationError("No chunk uploaded");
      if (static_cast<int64_t>(bytes.size()) > cfg_.maxChunkBytes) {
        send_error(res, 413, "Chunk exceeds " + std::to_string(cfg_.maxChunkBytes) + " bytes");
        return;
      }

      const ChunkReceipt r = uploads_.uploadChunk(sessionId, chunkIndex, bytes);
      send_json(res, 200, json{{"success", true},
                               {"chunkIndex", r.chunkIndex},
                               {"receivedCount", r.progress.received},
                               {"totalChunks", r.progress.total}});
    });
  });

  // POST /api/upload/finalize
  // Body: {"sessionId"}
  svr.Post("/api/upload/finalize", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const json j = parse_object(req.body);
      const std::string sessionId = session_id_from(j);
      if (sessionId.empty()) throw ValidationError("sessionId is required");

      const ArtifactRecord rec = uploads_.finalize(sessionId);
      send_json(res, 200, json{{"success", true},
                               {"message", "File uploaded successfully"},
                               {"currentVersion", rec.currentVersion},
                               {"minVersion", rec.minVersion},
                               {"originalName", rec.originalName},
                               {"uploadDate", to_iso8601(rec.uploadDate)}});
    });
  });

  // GET /api/upload/status/:sessionId
  svr.Get(R"(/api/upload/status/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const ChunkProgress p = uploads_.status(req.matches[1].str());
      send_json(res, 200, json{{"receivedCount", p.received},
                               {"totalChunks", p.total},
                               {"progressPercent", p.progressPercent()}});
    });
  });

  // GET /api/version
  svr.Get("/api/version", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      auto cur = catalog_.current();
      if (!cur) throw NoArtifactPublished();
      send_json(res, 200, json{{"currentVersion", cur->currentVersion},
                               {"minVersion", cur->minVersion},
                               {"downloadUrl", download_url_for(*cur, cfg_.downloadPrefix)},
                               {"uploadDate", to_iso8601(cur->uploadDate)},
                               {"fileSize", cur->fileSize}});
    });
  });

  // GET /api/download/:storedFilename  (current artifact only)
  svr.Get(R"(/api/download/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const std::string name = req.matches[1].str();
      auto rec = catalog_.findByStoredFilename(name);
      if (!rec || !fs_.hasArtifact(name)) throw NotFound("File not found");

      const auto path = fs_.artifactPath(name);
      const auto size = static_cast<size_t>(fs_.artifactSize(name));
      auto in = std::make_shared<std::ifstream>(path, std::ios::binary);
      if (!*in) throw NotFound("File not found");

      res.status = 200;
      res.set_header("Content-Disposition",
                     "attachment; filename=\"" + quote_filename(rec->originalName) + "\"");
      res.set_content_provider(
        size, "application/octet-stream",
        [in](size_t offset, size_t length, httplib::DataSink& sink) {
          char buf[64 * 1024];
          in->seekg(static_cast<std::streamoff>(offset));
          size_t n = length < sizeof(buf) ? length : sizeof(buf);
          in->read(buf, static_cast<std::streamsize>(n));
          std::streamsize got = in->gcount();
          if (got <= 0) {
            spdlog::error("download read failed at offset {}", offset);
            return false;
          }
          return sink.write(buf, static_cast<size_t>(got));
        });
    });
  });

  // POST /api/check-update
  // Body: {"clientVersion"}
  svr.Post("/api/check-update", [this](const httplib::Request& req, httplib::Response& res) {
    guarded(req, res, [&] {
      const json j = parse_object(req.body);
      const UpdateDecision d =
        decide_update(str_field(j, "clientVersion"), catalog_.current(), cfg_.downloadPrefix);
      send_json(res, 200, json{{"needsUpdate", d.needsUpdate},
                               {"hasUpdate", d.hasUpdate},
                               {"currentVersion", d.currentVersion},
                               {"minVersion", d.minVersion},
                               {"downloadUrl", d.downloadUrl ? json(*d.downloadUrl) : json(nullptr)}});
    });
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) send_error(res, 404, "not found");
  });

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
  });
}

bool HttpServer::listen(const std::string& host, int port) {
  spdlog::info("HTTP server listening on http://{}:{}", host, port);
  if (!svr_->listen(host, port)) {
    spdlog::error("Failed to bind port {}", port);
    return false;
  }
  return true;
}

int HttpServer::bindToAnyPort(const std::string& host) {
  return svr_->bind_to_any_port(host);
}

bool HttpServer::listenAfterBind() {
  return svr_->listen_after_bind();
}

void HttpServer::stop() {
  svr_->stop();
}

void run_http_server(UploadService& uploads,
                     ArtifactCatalog& catalog,
                     LocalFSBackend& fs,
                     const ServerConfig& cfg) {
  HttpServer server(uploads, catalog, fs, cfg);
  server.listen(cfg.host, cfg.port);
}

} // namespace uds
