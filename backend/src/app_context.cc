// ─── VeilProxy — AppContext implementation ──────────────────────────────

#include "app_context.h"
#include "utils.h"

#include <cstdlib>
#include <iostream>

namespace {

template <typename T>
void apply_env_number(const char *name, T &target, long min_value,
                      long max_value) {
  const char *raw = std::getenv(name);
  if (!raw || !*raw) return;
  auto value = env_long(name);
  if (!value || *value < min_value || *value > max_value) {
    CROW_LOG_WARNING << "Config: ignoring " << name << "=" << raw
                     << " (expected " << min_value << ".." << max_value << ")";
    return;
  }
  target = static_cast<T>(*value);
}

}  // namespace

// ── Configuration ───────────────────────────────────────────────────────

void AppContext::load_config_from_env() {
  if (const char *level = std::getenv("VEILPROXY_LOG_LEVEL")) {
    std::string lowered = to_lower(level);
    if (lowered == "debug" || lowered == "info" || lowered == "warning" ||
        lowered == "error" || lowered == "critical") {
      log_level = lowered;
    } else {
      std::cerr << "Config: unknown VEILPROXY_LOG_LEVEL '" << level
                << "', using " << log_level << '\n';
    }
  }
  crow::logger::setLogLevel(crow_log_level());

  apply_env_number("PORT", port, 1, 65535);
  apply_env_number("VEILPROXY_THREADS", threads, 1, 1024);
  apply_env_number("VEILPROXY_PROXY_TIMEOUT_MS", proxy_timeout_ms, 100, 600000);
  apply_env_number("VEILPROXY_IMAGE_TIMEOUT_MS", image_timeout_ms, 100, 600000);
  apply_env_number("VEILPROXY_ASSET_TIMEOUT_MS", asset_timeout_ms, 100, 600000);
  apply_env_number("VEILPROXY_MAX_REDIRECTS", max_redirects, 0, 20);
  apply_env_number("VEILPROXY_MAX_BODY_BYTES", max_body_bytes, 1024,
                   1024L * 1024 * 1024);

  if (const char *bind = std::getenv("VEILPROXY_BIND")) {
    if (*bind) bind_address = bind;
  }
  if (const char *search = std::getenv("VEILPROXY_SEARCH_URL")) {
    if (*search) search_base_url = search;
  }
  if (const char *verify = std::getenv("VEILPROXY_TLS_VERIFY")) {
    std::string lowered = to_lower(verify);
    tls_verify = !(lowered == "0" || lowered == "false" || lowered == "no");
  }
  if (const char *gzip = std::getenv("VEILPROXY_COMPRESSION")) {
    std::string lowered = to_lower(gzip);
    compression = !(lowered == "0" || lowered == "false" || lowered == "no");
  }
  if (const char *secret = std::getenv("SECRET_KEY")) {
    secret_key = secret;
  }
}

crow::LogLevel AppContext::crow_log_level() const {
  if (log_level == "debug") return crow::LogLevel::Debug;
  if (log_level == "warning") return crow::LogLevel::Warning;
  if (log_level == "error") return crow::LogLevel::Error;
  if (log_level == "critical") return crow::LogLevel::Critical;
  return crow::LogLevel::Info;
}

// ── Codec ───────────────────────────────────────────────────────────────

void AppContext::init_codec() {
  if (secret_key.empty()) {
    secret_key = crypto::random_hex(32);
    CROW_LOG_WARNING << "SECRET_KEY not set; generated a per-process key "
                        "(proxy links will not survive a restart)";
  }
  codec = std::make_unique<crypto::TokenCodec>(secret_key);
  rewriter = std::make_unique<DocumentRewriter>(*codec);
}

// ── Fetch defaults ──────────────────────────────────────────────────────

FetchRequest AppContext::make_fetch_request(const std::string &url,
                                            int timeout_ms) const {
  FetchRequest request;
  request.url = url;
  request.timeout_ms = timeout_ms;
  request.max_redirects = max_redirects;
  request.max_body_bytes = max_body_bytes;
  request.verify_tls = tls_verify;
  return request;
}

double AppContext::uptime_seconds() const {
  auto elapsed = std::chrono::steady_clock::now() - started_at;
  return std::chrono::duration<double>(elapsed).count();
}
