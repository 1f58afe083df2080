#pragma once
// ─── VeilProxy — Application context ────────────────────────────────────
// Holds configuration and the shared, process-wide services (codec,
// rewriter, presence).  Everything here is read-only once the server runs,
// except the presence state, which carries its own locks.

#include "crow.h"
#include "crypto.h"
#include "models.h"
#include "presence.h"
#include "rewriter.h"
#include "search.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

struct AppContext {
  // ── Listener ──
  std::string bind_address = "0.0.0.0";
  int port = 8080;
  unsigned int threads = 0;  // 0: one per hardware thread
  bool compression = true;   // gzip responses for clients that accept it

  // ── Upstream fetch ──
  int proxy_timeout_ms = 8000;
  int image_timeout_ms = 5000;
  int asset_timeout_ms = 6000;
  int max_redirects = 5;
  size_t max_body_bytes = 16 * 1024 * 1024;
  bool tls_verify = true;

  // ── Search ──
  std::string search_base_url = kDefaultSearchUrl;

  // ── Logging ──
  std::string log_level = "info";

  // ── Codec ──
  std::string secret_key;
  std::unique_ptr<crypto::TokenCodec> codec;
  std::unique_ptr<DocumentRewriter> rewriter;

  // ── Presence ──
  PresenceTracker presence;
  std::mutex ws_mutex;
  std::unordered_map<crow::websocket::connection *, std::string> ws_clients;

  std::chrono::steady_clock::time_point started_at =
      std::chrono::steady_clock::now();

  // Reads PORT, SECRET_KEY and the VEILPROXY_* variables.  Bad values are
  // logged and the defaults kept.
  void load_config_from_env();

  // Derives the codec key and builds the rewriter.  Generates a random
  // secret when none was configured.  Throws crypto::CodecError.
  void init_codec();

  crow::LogLevel crow_log_level() const;

  // Fetch defaults for one upstream request.
  FetchRequest make_fetch_request(const std::string &url, int timeout_ms) const;

  double uptime_seconds() const;
};
