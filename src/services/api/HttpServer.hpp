#pragma once
#include <cstddef>
#include <string>

namespace httplib { class Server; }

namespace mgw {

class MediaService;
struct GatewayConfig;

struct HttpOptions {
  std::size_t maxUploadBytes = 512u * 1024 * 1024;
  int         threads = 8;
};

// Registers the gateway endpoints and error handling on svr.
void install_routes(httplib::Server& svr, MediaService& service, const HttpOptions& opts);

// Start a blocking HTTP server on cfg.host:cfg.port.
// Throws std::runtime_error if the port cannot be bound.
void run_http_server(MediaService& service, const GatewayConfig& cfg);

} // namespace mgw
