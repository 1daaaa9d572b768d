#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "core/Errors.hpp"
#include "core/config/GatewayConfig.hpp"
#include "core/media/MediaService.hpp"
#include "MediaJson.hpp"

using nlohmann::json;

// -------- helpers --------

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void send_detail(httplib::Response& res, int status, const std::string& detail) {
  send_json(res, status, json{{"detail", detail}});
}

// cpp-httplib parses Range itself and slices content-provider bodies by
// req.ranges. The gateway owns range semantics, so that parse is dropped.
// The Request handed to handlers is a non-const object inside the server.
static void disown_ranges(const httplib::Request& req) {
  const_cast<httplib::Request&>(req).ranges.clear();
}

static std::optional<std::string_view> range_header_of(const httplib::Request& req) {
  auto it = req.headers.find("Range");
  if (it == req.headers.end()) return std::nullopt;
  return std::string_view(it->second);
}

namespace {

// Adapts httplib's DataSink to the pump's sink.
class HttplibSink : public mgw::ChunkSink {
public:
  explicit HttplibSink(httplib::DataSink& sink) : sink_(sink) {}

  bool write(const char* data, std::size_t len) override {
    if (sink_.is_writable && !sink_.is_writable()) return false;
    return sink_.write(data, len);
  }

private:
  httplib::DataSink& sink_;
};

struct Route {
  std::string method;
  std::regex pattern;
  httplib::Server::Handler handler;
};

// Every route, in registration order, so a request httplib turned away
// before routing can still be answered by the handler it was meant for.
using RouteTable = std::vector<Route>;

bool has_no_body(const std::string& method) {
  return method == "GET" || method == "HEAD" || method == "DELETE" || method == "OPTIONS";
}

} // namespace

// -------- server --------

namespace mgw {

// Answers GET /stream/{id}; the whole outcome comes from the service's plan.
static void handle_stream(MediaService& service,
                          const std::string& id,
                          std::optional<std::string_view> range,
                          httplib::Response& res) {
  StreamPlan plan;
  try {
    plan = service.planStream(id, range);
  } catch (const std::exception& e) {
    spdlog::error("stream {}: registry lookup failed: {}", id, e.what());
    send_detail(res, 502, "Storage unavailable");
    return;
  }

  spdlog::debug("stream {}: range '{}' -> {}", id, range ? std::string(*range) : "-", plan.status);

  switch (plan.outcome) {
    case StreamOutcome::NotFound:
      send_detail(res, 404, "Media not found");
      return;
    case StreamOutcome::RangeNotSatisfiable:
      res.status = plan.status;
      for (const auto& [k, v] : plan.headers) res.set_header(k, v);
      return;
    case StreamOutcome::FullBody:
    case StreamOutcome::PartialBody:
      break;
  }

  std::shared_ptr<BodyPump> pump;
  try {
    pump = service.openBody(plan);
  } catch (const NotFoundError&) {
    send_detail(res, 404, "Media not found");
    return;
  } catch (const std::exception& e) {
    spdlog::error("stream {}: cannot open object: {}", id, e.what());
    send_detail(res, 502, "Storage unavailable");
    return;
  }

  res.status = plan.status;
  for (const auto& [k, v] : plan.headers) {
    // httplib writes these from the content provider
    if (k == "Content-Length" || k == "Content-Type") continue;
    res.set_header(k, v);
  }

  if (plan.length == 0) {
    res.set_content(std::string(), plan.contentType);
    return;
  }

  res.set_content_provider(
    static_cast<size_t>(plan.length), plan.contentType,
    [pump](size_t offset, size_t /*length*/, httplib::DataSink& sink) {
      if (static_cast<int64_t>(offset) != pump->emitted()) return false;
      HttplibSink out(sink);
      const PumpStatus st = pump->emitChunk(out);
      return st == PumpStatus::Continue || st == PumpStatus::Done;
    },
    [pump, id](bool success) {
      if (!success) {
        spdlog::debug("stream {}: aborted after {} of {} bytes", id, pump->emitted(), pump->length());
      }
      pump->release();
    });
}

// httplib rejects a Range header its own parser dislikes with 416 before any
// handler runs. Range semantics belong to the stream handler, so the request
// is dispatched here the way the router would have done it. Requests with a
// body are left alone; httplib has not read it at this point.
static void replay_rejected_range(const RouteTable& routes,
                                  const httplib::Request& req,
                                  httplib::Response& res) {
  if (!has_no_body(req.method)) return;
  const std::string method = req.method == "HEAD" ? "GET" : req.method;

  auto& r = const_cast<httplib::Request&>(req);
  for (const auto& route : routes) {
    if (route.method != method || !std::regex_match(r.path, r.matches, route.pattern)) continue;
    res.status = -1;
    try {
      route.handler(req, res);
    } catch (const std::exception& e) {
      spdlog::error("{} {}: unhandled: {}", req.method, req.path, e.what());
      send_detail(res, 500, "Internal server error");
    }
    return;
  }
  send_detail(res, 404, "Not Found");
}

void install_routes(httplib::Server& svr, MediaService& service, const HttpOptions& opts) {
  svr.set_payload_max_length(opts.maxUploadBytes);

  svr.set_default_headers({
    {"Access-Control-Allow-Origin", "*"},
  });

  svr.set_pre_routing_handler([](const httplib::Request& req, httplib::Response&) {
    disown_ranges(req);
    return httplib::Server::HandlerResponse::Unhandled;
  });

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {}", req.method, req.path, res.status);
  });

  auto routes = std::make_shared<RouteTable>();
  auto route = [&svr, &routes](const std::string& method, const std::string& pattern,
                               httplib::Server::Handler handler) {
    routes->push_back(Route{method, std::regex(pattern), handler});
    if (method == "GET") svr.Get(pattern, std::move(handler));
    else if (method == "POST") svr.Post(pattern, std::move(handler));
    else if (method == "DELETE") svr.Delete(pattern, std::move(handler));
    else if (method == "OPTIONS") svr.Options(pattern, std::move(handler));
  };

  route("GET", "/", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, json{
      {"message", "Media Upload & Streaming API"},
      {"endpoints", {"/upload", "/stream/{media_id}", "/media/{media_id}",
                     "/media/list", "/media/{media_id} [DELETE]"}},
    });
  });

  // Health check
  route("GET", "/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // CORS preflight
  route("OPTIONS", R"(.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
    res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "*");
    res.set_header("Access-Control-Max-Age", "600");
  });

  // POST /upload
  // multipart/form-data with the media in field "file"
  route("POST", "/upload", [&service](const httplib::Request& req, httplib::Response& res) {
    if (!req.is_multipart_form_data() || !req.has_file("file")) {
      send_detail(res, 400, "No file provided");
      return;
    }
    const auto file = req.get_file_value("file");

    try {
      const MediaDescriptor d = service.upload(file.content, file.filename, file.content_type);
      send_json(res, 200, upload_response(d));
    } catch (const InvalidUpload& e) {
      spdlog::warn("upload of '{}' rejected: {}", file.filename, e.what());
      send_detail(res, 400, e.what());
    } catch (const StorageFailure& e) {
      spdlog::error("upload of '{}' failed: {}", file.filename, e.what());
      send_detail(res, 502, "Upload failed");
    }
  });

  route("GET", R"(/stream/([^/]+))", [&service](const httplib::Request& req, httplib::Response& res) {
    handle_stream(service, req.matches[1], range_header_of(req), res);
  });

  // registered before /media/{id} so "list" is not taken for an id
  route("GET", "/media/list", [&service](const httplib::Request&, httplib::Response& res) {
    try {
      const auto all = service.list();
      send_json(res, 200, json{{"total", all.size()}, {"media", all}});
    } catch (const StorageFailure& e) {
      spdlog::error("list failed: {}", e.what());
      send_detail(res, 502, "Storage unavailable");
    }
  });

  route("GET", R"(/media/([^/]+))", [&service](const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    try {
      send_json(res, 200, json(service.info(id)));
    } catch (const NotFoundError&) {
      send_detail(res, 404, "Media not found");
    } catch (const StorageFailure& e) {
      spdlog::error("info {} failed: {}", id, e.what());
      send_detail(res, 502, "Storage unavailable");
    }
  });

  route("DELETE", R"(/media/([^/]+))", [&service](const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    try {
      service.remove(id);
      send_json(res, 200, json{{"success", true}, {"message", "Media deleted successfully"}});
    } catch (const NotFoundError&) {
      send_detail(res, 404, "Media not found");
    } catch (const StorageFailure& e) {
      spdlog::error("delete {} failed: {}", id, e.what());
      send_detail(res, 502, "Delete failed");
    }
  });

  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      spdlog::error("{} {}: unhandled: {}", req.method, req.path, e.what());
    } catch (...) {
      spdlog::error("{} {}: unhandled non-standard exception", req.method, req.path);
    }
    send_detail(res, 500, "Internal server error");
  });

  // Fallback
  svr.set_error_handler([routes](const httplib::Request& req, httplib::Response& res) {
    disown_ranges(req);

    if (res.status == 416) {
      // the stream handler's own 416 always names the resource length
      if (res.has_header("Content-Range")) return;
      replay_rejected_range(*routes, req, res);
      return;
    }

    if (res.body.empty() && res.status >= 400) {
      send_detail(res, res.status, httplib::status_message(res.status));
    }
  });
}

void run_http_server(MediaService& service, const GatewayConfig& cfg) {
  httplib::Server svr;

  const int threads = cfg.threads;
  svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

  install_routes(svr, service, HttpOptions{cfg.maxUploadBytes, cfg.threads});

  spdlog::info("HTTP server listening on http://{}:{}", cfg.host, cfg.port);
  if (!svr.listen(cfg.host, cfg.port)) {
    spdlog::error("Failed to bind port {}", cfg.port);
    throw std::runtime_error("cannot listen on " + cfg.host + ":" + std::to_string(cfg.port));
  }
}

} // namespace mgw
