// ─── VeilProxy — Upstream client and token routes ───────────────────────

#include "http_proxy.h"
#include "app_context.h"
#include "templates.h"
#include "utils.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kMaxHeaderBytes = 64 * 1024;
constexpr const char kAssetCacheControl[] = "public, max-age=3600";

int remaining_ms(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - Clock::now())
                  .count();
  return left > 0 ? static_cast<int>(left) : 0;
}

bool set_socket_timeout(int sock, int ms) {
  struct timeval tv;
  tv.tv_sec = ms / 1000;
  tv.tv_usec = (ms % 1000) * 1000;
  return setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0 &&
         setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

bool is_timeout_errno(int err) {
  return err == EAGAIN || err == EWOULDBLOCK || err == EINPROGRESS ||
         err == ETIMEDOUT;
}

void fail(FetchResult &result, FetchError error, const std::string &message) {
  result.error = error;
  result.error_message = message;
}

// ═══════════════════════════════════════════════════════════════════════
//  DNS with a deadline
// ═══════════════════════════════════════════════════════════════════════

struct AddrInfoDeleter {
  void operator()(addrinfo *list) const {
    if (list) freeaddrinfo(list);
  }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

struct ResolveJob {
  std::mutex mutex;
  std::condition_variable done_cv;
  bool done = false;
  bool abandoned = false;
  int rc = 0;
  addrinfo *result = nullptr;
};

addrinfo lookup_hints(int flags) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = flags;
  return hints;
}

// getaddrinfo has no timeout of its own, so name lookups run on a detached
// thread and the caller stops waiting at the deadline.  An abandoned
// lookup frees its own result.  IP literals never block and are
// converted inline.
AddrInfoPtr resolve_host(const std::string &host, int port,
                         Clock::time_point deadline, FetchResult &result) {
  const std::string lookup_host = bare_host(host);
  const std::string port_str = std::to_string(port);

  if (is_ip_literal(lookup_host)) {
    const addrinfo hints = lookup_hints(AI_NUMERICHOST | AI_NUMERICSERV);
    addrinfo *list = nullptr;
    int rc = getaddrinfo(lookup_host.c_str(), port_str.c_str(), &hints, &list);
    if (rc != 0 || !list) {
      fail(result, FetchError::Unreachable,
           "Invalid address " + host + ": " + gai_strerror(rc));
      return nullptr;
    }
    return AddrInfoPtr(list);
  }

  auto job = std::make_shared<ResolveJob>();
  std::thread([job, lookup_host, port_str]() {
    const addrinfo hints = lookup_hints(0);
    addrinfo *list = nullptr;
    int rc = getaddrinfo(lookup_host.c_str(), port_str.c_str(), &hints, &list);

    std::lock_guard<std::mutex> lock(job->mutex);
    if (job->abandoned) {
      if (list) freeaddrinfo(list);
      return;
    }
    job->rc = rc;
    job->result = (rc == 0) ? list : nullptr;
    job->done = true;
    job->done_cv.notify_one();
  }).detach();

  std::unique_lock<std::mutex> lock(job->mutex);
  if (!job->done_cv.wait_until(lock, deadline, [&job] { return job->done; })) {
    job->abandoned = true;
    fail(result, FetchError::Timeout, "DNS lookup for " + host + " timed out");
    return nullptr;
  }
  if (job->rc != 0 || !job->result) {
    fail(result, FetchError::NotFound,
         "Failed to resolve hostname " + host + ": " +
             gai_strerror(job->rc));
    return nullptr;
  }
  return AddrInfoPtr(job->result);
}

// ═══════════════════════════════════════════════════════════════════════
//  TLS context
// ═══════════════════════════════════════════════════════════════════════

struct SslCtxDeleter {
  void operator()(SSL_CTX *ctx) const { SSL_CTX_free(ctx); }
};
using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

SslCtxPtr make_tls_context(bool verify) {
  SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
  if (!ctx) return ctx;
  SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
  SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
  if (verify) {
    if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
      CROW_LOG_WARNING << "TLS: could not load the default CA store";
    }
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
  } else {
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
  }
  return ctx;
}

SSL_CTX *client_tls_context(bool verify) {
  static SslCtxPtr verifying = make_tls_context(true);
  static SslCtxPtr permissive = make_tls_context(false);
  return verify ? verifying.get() : permissive.get();
}

std::string openssl_error_text() {
  unsigned long code = ERR_get_error();
  if (code == 0) return "TLS failure";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

// ═══════════════════════════════════════════════════════════════════════
//  Connection (plain TCP or TLS)
// ═══════════════════════════════════════════════════════════════════════

class UpstreamConnection {
 public:
  UpstreamConnection() = default;
  UpstreamConnection(const UpstreamConnection &) = delete;
  UpstreamConnection &operator=(const UpstreamConnection &) = delete;

  ~UpstreamConnection() {
    if (ssl_) SSL_free(ssl_);
    if (sock_ >= 0) close(sock_);
  }

  bool open(const Url &target, bool verify_tls, Clock::time_point deadline,
            FetchResult &result) {
    AddrInfoPtr addresses =
        resolve_host(target.host, target.effective_port(), deadline, result);
    if (!addresses) return false;

    int last_errno = 0;
    for (addrinfo *ptr = addresses.get(); ptr != nullptr; ptr = ptr->ai_next) {
      int left = remaining_ms(deadline);
      if (left <= 0) {
        last_errno = ETIMEDOUT;
        break;
      }
      int sock = socket(ptr->ai_family, ptr->ai_socktype, ptr->ai_protocol);
      if (sock < 0) {
        last_errno = errno;
        continue;
      }
      if (!set_socket_timeout(sock, left)) {
        last_errno = errno;
        close(sock);
        continue;
      }
      if (connect(sock, ptr->ai_addr, ptr->ai_addrlen) == 0) {
        sock_ = sock;
        break;
      }
      last_errno = errno;
      close(sock);
    }

    if (sock_ < 0) {
      if (last_errno == ECONNREFUSED) {
        fail(result, FetchError::Refused,
             "Connection refused by " + target.host_port());
      } else if (is_timeout_errno(last_errno)) {
        fail(result, FetchError::Timeout,
             "Connection to " + target.host_port() + " timed out");
      } else {
        fail(result, FetchError::Unreachable,
             "Failed to connect to " + target.host_port() + ": " +
                 std::strerror(last_errno));
      }
      return false;
    }

    if (target.scheme == "https") return start_tls(target, verify_tls, deadline, result);
    return true;
  }

  bool write_all(const std::string &data, Clock::time_point deadline,
                 FetchResult &result) {
    size_t sent = 0;
    while (sent < data.size()) {
      int left = remaining_ms(deadline);
      if (left <= 0 || !set_socket_timeout(sock_, left)) {
        fail(result, FetchError::Timeout, "Timed out sending the request");
        return false;
      }
      long n = 0;
      if (ssl_) {
        n = SSL_write(ssl_, data.data() + sent,
                      static_cast<int>(data.size() - sent));
      } else {
        n = send(sock_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      }
      if (n <= 0) {
        io_failure(result, "send", deadline);
        return false;
      }
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  // Bytes read, 0 on orderly close, -1 on failure (recorded in `result`).
  long read_some(char *buffer, size_t size, Clock::time_point deadline,
                 FetchResult &result) {
    int left = remaining_ms(deadline);
    if (left <= 0 || !set_socket_timeout(sock_, left)) {
      fail(result, FetchError::Timeout, "Timed out waiting for the response");
      return -1;
    }
    if (ssl_) {
      int n = SSL_read(ssl_, buffer, static_cast<int>(size));
      if (n > 0) return n;
      int ssl_error = SSL_get_error(ssl_, n);
      if (ssl_error == SSL_ERROR_ZERO_RETURN) return 0;
      if (ssl_error == SSL_ERROR_SYSCALL && errno == 0) return 0;
      io_failure(result, "read", deadline);
      return -1;
    }
    ssize_t n = recv(sock_, buffer, size, 0);
    if (n >= 0) return static_cast<long>(n);
    io_failure(result, "read", deadline);
    return -1;
  }

 private:
  bool start_tls(const Url &target, bool verify_tls,
                 Clock::time_point deadline, FetchResult &result) {
    SSL_CTX *ctx = client_tls_context(verify_tls);
    if (!ctx) {
      fail(result, FetchError::Tls, "TLS context unavailable");
      return false;
    }
    ssl_ = SSL_new(ctx);
    if (!ssl_ || SSL_set_fd(ssl_, sock_) != 1) {
      fail(result, FetchError::Tls, openssl_error_text());
      return false;
    }

    const std::string host = bare_host(target.host);
    if (is_ip_literal(host)) {
      if (verify_tls &&
          X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl_), host.c_str()) != 1) {
        fail(result, FetchError::Tls, openssl_error_text());
        return false;
      }
    } else {
      if (SSL_set_tlsext_host_name(ssl_, host.c_str()) != 1 ||
          (verify_tls && SSL_set1_host(ssl_, host.c_str()) != 1)) {
        fail(result, FetchError::Tls, openssl_error_text());
        return false;
      }
    }

    int left = remaining_ms(deadline);
    if (left <= 0 || !set_socket_timeout(sock_, left)) {
      fail(result, FetchError::Timeout, "TLS handshake timed out");
      return false;
    }
    errno = 0;
    if (SSL_connect(ssl_) != 1) {
      long verify_result = SSL_get_verify_result(ssl_);
      if (verify_tls && verify_result != X509_V_OK) {
        ERR_clear_error();
        fail(result, FetchError::Tls,
             std::string("Certificate verification failed: ") +
                 X509_verify_cert_error_string(verify_result));
      } else if (is_timeout_errno(errno) || remaining_ms(deadline) == 0) {
        ERR_clear_error();
        fail(result, FetchError::Timeout, "TLS handshake timed out");
      } else {
        fail(result, FetchError::Tls,
             "TLS handshake with " + target.host_port() + " failed: " +
                 openssl_error_text());
      }
      return false;
    }
    return true;
  }

  void io_failure(FetchResult &result, const char *what,
                  Clock::time_point deadline) {
    int err = errno;
    if (is_timeout_errno(err) || remaining_ms(deadline) == 0) {
      ERR_clear_error();
      fail(result, FetchError::Timeout,
           std::string("Timed out during ") + what);
    } else if (ssl_) {
      fail(result, FetchError::Tls,
           std::string("TLS ") + what + " failed: " + openssl_error_text());
    } else {
      fail(result, FetchError::Unreachable,
           std::string("Socket ") + what + " failed: " + std::strerror(err));
    }
  }

  int sock_ = -1;
  SSL *ssl_ = nullptr;
};

std::string build_request_text(const FetchRequest &request, const Url &target) {
  std::ostringstream out;
  out << request.method << " " << target.request_target() << " HTTP/1.1\r\n";
  out << "Host: " << target.host_port() << "\r\n";
  out << "User-Agent: " << request.user_agent << "\r\n";
  out << "Accept: " << request.accept << "\r\n";
  out << "Accept-Encoding: identity\r\n";
  out << "Connection: close\r\n";
  if (!request.referer.empty()) out << "Referer: " << request.referer << "\r\n";

  for (const auto &kv : request.extra_headers) {
    const std::string name = to_lower(kv.first);
    if (name == "host" || name == "connection" || name == "content-length" ||
        name == "transfer-encoding" || name == "accept-encoding" ||
        name == "user-agent" || name == "accept" || name == "referer") {
      continue;
    }
    if (kv.second.find_first_of("\r\n") != std::string::npos) continue;
    out << kv.first << ": " << kv.second << "\r\n";
  }

  if (!request.body.empty() || request.method == "POST") {
    if (!request.content_type.empty()) {
      out << "Content-Type: " << request.content_type << "\r\n";
    }
    out << "Content-Length: " << request.body.size() << "\r\n";
  }
  out << "\r\n";
  out << request.body;
  return out.str();
}

bool chunked_body_complete(const std::string &raw, size_t body_start) {
  if (raw.size() < body_start + 5) return false;
  if (raw.compare(body_start, 5, "0\r\n\r\n") == 0) return true;
  return raw.size() >= body_start + 7 &&
         raw.compare(raw.size() - 7, 7, "\r\n0\r\n\r\n") == 0;
}

// End of the header block, accepting CRLF or bare-LF line endings.
size_t find_header_end(const std::string &raw, size_t &separator_len) {
  const size_t crlf = raw.find("\r\n\r\n");
  const size_t lf = raw.find("\n\n");
  if (lf != std::string::npos && (crlf == std::string::npos || lf < crlf)) {
    separator_len = 2;
    return lf;
  }
  separator_len = 4;
  return crlf;
}

bool is_redirect_status(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 ||
         status == 308;
}

// ═══════════════════════════════════════════════════════════════════════
//  Response helpers
// ═══════════════════════════════════════════════════════════════════════

crow::response html_response(int code, const std::string &body) {
  crow::response resp(code, body);
  resp.set_header("Content-Type", "text/html; charset=utf-8");
  return resp;
}

crow::response placeholder_image_response() {
  crow::response resp(200, placeholder_png());
  resp.set_header("Content-Type", "image/png");
  return resp;
}

bool is_cacheable_type(const std::string &content_type_lower) {
  return content_type_lower.find("image/") != std::string::npos ||
         content_type_lower.find("text/css") != std::string::npos ||
         content_type_lower.find("javascript") != std::string::npos;
}

void forward_client_headers(const crow::request &request, FetchRequest &fetch) {
  auto accept_language = request.get_header_value("Accept-Language");
  if (!accept_language.empty()) {
    fetch.extra_headers["Accept-Language"] = accept_language;
  }
}

std::string referer_for(const std::string &target) {
  auto url = parse_absolute_url(target);
  return url ? url->origin() : std::string();
}

bool is_success(const UpstreamResponse &response) {
  return response.status_code >= 200 && response.status_code < 300;
}

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════
//  Response parsing
// ═══════════════════════════════════════════════════════════════════════

std::optional<std::string> dechunk_body(const std::string &body) {
  std::string dechunked;
  size_t pos = 0;

  while (pos < body.size()) {
    size_t line_end = body.find("\r\n", pos);
    size_t line_len = 2;
    if (line_end == std::string::npos) {
      line_end = body.find('\n', pos);
      line_len = 1;
    }
    if (line_end == std::string::npos) return std::nullopt;

    std::string len_text = body.substr(pos, line_end - pos);
    size_t ext_pos = len_text.find(';');
    if (ext_pos != std::string::npos) len_text = len_text.substr(0, ext_pos);
    len_text = trim_copy(len_text);
    if (len_text.empty() ||
        !std::all_of(len_text.begin(), len_text.end(),
                     [](unsigned char ch) { return std::isxdigit(ch); })) {
      return std::nullopt;
    }

    size_t chunk_len = 0;
    try {
      chunk_len = std::stoul(len_text, nullptr, 16);
    } catch (const std::exception &) {
      return std::nullopt;
    }

    pos = line_end + line_len;
    if (chunk_len == 0) return dechunked;
    if (pos + chunk_len > body.size()) return std::nullopt;
    dechunked.append(body, pos, chunk_len);
    pos += chunk_len;
    if (pos + 1 < body.size() && body[pos] == '\r' && body[pos + 1] == '\n') {
      pos += 2;
    } else if (pos < body.size() && body[pos] == '\n') {
      pos += 1;
    }
  }
  // Ran out of data before the terminating zero-length chunk.
  return std::nullopt;
}

bool parse_http_response(const std::string &raw, UpstreamResponse &response,
                         std::string &error) {
  size_t separator_len = 4;
  const size_t header_end = find_header_end(raw, separator_len);
  if (header_end == std::string::npos) {
    error = "Invalid HTTP response";
    return false;
  }

  // Status line
  size_t status_line_end = raw.find('\n');
  std::string status_line = trim_copy(raw.substr(0, status_line_end));
  if (status_line.rfind("HTTP/", 0) != 0) {
    error = "Invalid HTTP status line";
    return false;
  }
  size_t code_start = status_line.find(' ');
  if (code_start == std::string::npos || code_start + 4 > status_line.size() + 1) {
    error = "Failed to parse status code";
    return false;
  }
  std::string code_text = status_line.substr(code_start + 1, 3);
  if (code_text.size() != 3 ||
      !std::all_of(code_text.begin(), code_text.end(),
                   [](unsigned char ch) { return std::isdigit(ch); })) {
    error = "Failed to parse status code";
    return false;
  }
  response.status_code = std::stoi(code_text);

  // Headers
  size_t pos = status_line_end + 1;
  while (pos < header_end) {
    size_t line_end = raw.find('\n', pos);
    if (line_end == std::string::npos || line_end > header_end) line_end = header_end;
    std::string header_line = raw.substr(pos, line_end - pos);
    if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos && colon_pos > 0) {
      std::string name = to_lower(trim_copy(header_line.substr(0, colon_pos)));
      std::string value = trim_copy(header_line.substr(colon_pos + 1));
      auto existing = response.headers.find(name);
      if (existing == response.headers.end()) {
        response.headers[name] = value;
      } else {
        existing->second += ", " + value;
      }
    }
    pos = line_end + 1;
  }

  response.body = raw.substr(header_end + separator_len);

  auto encoding_it = response.headers.find("transfer-encoding");
  if (encoding_it != response.headers.end() &&
      to_lower(encoding_it->second).find("chunked") != std::string::npos) {
    auto dechunked = dechunk_body(response.body);
    if (!dechunked) {
      error = "Malformed chunked response body";
      return false;
    }
    response.body = std::move(*dechunked);
    response.headers.erase("transfer-encoding");
    response.headers["content-length"] = std::to_string(response.body.size());
  } else {
    auto length_it = response.headers.find("content-length");
    if (length_it != response.headers.end()) {
      size_t expected = 0;
      try {
        expected = std::stoul(length_it->second);
      } catch (const std::exception &) {
        error = "Invalid Content-Length";
        return false;
      }
      if (response.body.size() < expected) {
        error = "Upstream closed before the full body arrived";
        return false;
      }
      response.body.resize(expected);
    }
  }

  auto type_it = response.headers.find("content-type");
  if (type_it != response.headers.end()) response.content_type = type_it->second;
  auto location_it = response.headers.find("location");
  if (location_it != response.headers.end()) response.location = location_it->second;
  return true;
}

// ═══════════════════════════════════════════════════════════════════════
//  Low-level HTTP client
// ═══════════════════════════════════════════════════════════════════════

FetchResult http_proxy_request(const FetchRequest &request, const Url &target,
                               int deadline_ms) {
  FetchResult result;
  result.final_url = target.serialize();
  const auto deadline = Clock::now() + std::chrono::milliseconds(deadline_ms);

  UpstreamConnection connection;
  if (!connection.open(target, request.verify_tls, deadline, result)) {
    return result;
  }
  if (!connection.write_all(build_request_text(request, target), deadline,
                            result)) {
    return result;
  }

  // ── Receive response ──
  std::string raw;
  char buffer[16384];
  const size_t limit = request.max_body_bytes + kMaxHeaderBytes;
  auto read_more = [&]() -> long {
    long n = connection.read_some(buffer, sizeof(buffer), deadline, result);
    if (n > 0) {
      raw.append(buffer, static_cast<size_t>(n));
      if (raw.size() > limit) {
        fail(result, FetchError::TooLarge,
             "Response exceeds " + std::to_string(request.max_body_bytes) +
                 " bytes");
        return -1;
      }
    }
    return n;
  };

  // Phase 1: read until headers complete
  size_t header_end = std::string::npos;
  size_t separator_len = 4;
  while ((header_end = find_header_end(raw, separator_len)) ==
         std::string::npos) {
    if (raw.size() > kMaxHeaderBytes) {
      fail(result, FetchError::Protocol, "Response headers too large");
      return result;
    }
    long n = read_more();
    if (n < 0) return result;
    if (n == 0) break;
  }
  if (header_end == std::string::npos) {
    fail(result, FetchError::Protocol,
         raw.empty() ? "No response from upstream"
                     : "Incomplete HTTP response headers");
    return result;
  }

  const size_t body_start = header_end + separator_len;
  const std::string header_block_lower = to_lower(raw.substr(0, header_end));

  long expected_content_length = -1;
  bool is_chunked = false;
  {
    size_t cl_pos = header_block_lower.find("\ncontent-length:");
    if (cl_pos != std::string::npos) {
      size_t val_start = cl_pos + 16;
      size_t val_end = header_block_lower.find('\n', val_start);
      if (val_end == std::string::npos) val_end = header_block_lower.size();
      try {
        expected_content_length = std::stol(
            header_block_lower.substr(val_start, val_end - val_start));
      } catch (const std::exception &) {
        expected_content_length = -1;
      }
    }
    size_t te_pos = header_block_lower.find("\ntransfer-encoding:");
    if (te_pos != std::string::npos) {
      size_t te_end = header_block_lower.find('\n', te_pos + 1);
      is_chunked = header_block_lower.substr(te_pos, te_end - te_pos)
                       .find("chunked") != std::string::npos;
    }
  }

  // Phase 2: read body
  if (is_chunked) {
    while (!chunked_body_complete(raw, body_start)) {
      long n = read_more();
      if (n < 0) return result;
      if (n == 0) break;
    }
  } else if (expected_content_length >= 0) {
    if (static_cast<size_t>(expected_content_length) > request.max_body_bytes) {
      fail(result, FetchError::TooLarge,
           "Response exceeds " + std::to_string(request.max_body_bytes) +
               " bytes");
      return result;
    }
    while (raw.size() - body_start <
           static_cast<size_t>(expected_content_length)) {
      long n = read_more();
      if (n < 0) return result;
      if (n == 0) break;
    }
  } else {
    while (true) {
      long n = read_more();
      if (n < 0) return result;
      if (n == 0) break;
    }
  }

  std::string parse_error;
  if (!parse_http_response(raw, result.response, parse_error)) {
    fail(result, FetchError::Protocol, parse_error);
  }
  return result;
}

FetchResult fetch_url(const FetchRequest &request) {
  const auto deadline =
      Clock::now() + std::chrono::milliseconds(request.timeout_ms);
  FetchRequest hop = request;
  std::string current = request.url;

  for (int redirects = 0;; ++redirects) {
    auto target = parse_absolute_url(current);
    if (!target || (target->scheme != "http" && target->scheme != "https")) {
      FetchResult result;
      result.final_url = current;
      fail(result, FetchError::Protocol, "Unsupported URL: " + current);
      return result;
    }
    int left = remaining_ms(deadline);
    if (left <= 0) {
      FetchResult result;
      result.final_url = current;
      fail(result, FetchError::Timeout, "Timed out following redirects");
      return result;
    }

    FetchResult result = http_proxy_request(hop, *target, left);
    result.final_url = current;
    if (!result.ok()) return result;

    const int status = result.response.status_code;
    if (!is_redirect_status(status) || result.response.location.empty() ||
        redirects >= request.max_redirects) {
      return result;
    }
    auto next = resolve_reference(current, result.response.location);
    if (!next) return result;

    if (status == 303 ||
        ((status == 301 || status == 302) && hop.method == "POST")) {
      hop.method = "GET";
      hop.body.clear();
      hop.content_type.clear();
    }
    CROW_LOG_DEBUG << "Fetch: " << status << " " << current << " -> " << *next;
    current = *next;
  }
}

std::string describe_fetch_error(FetchError error) {
  switch (error) {
    case FetchError::None:     return "OK";
    case FetchError::Timeout:  return "Timeout";
    case FetchError::NotFound: return "Site not found";
    case FetchError::Refused:  return "Connection refused";
    default:                   return "Failed to load";
  }
}

// ═══════════════════════════════════════════════════════════════════════
//  Token route handlers
// ═══════════════════════════════════════════════════════════════════════

crow::response handle_proxy_request(AppContext &ctx,
                                    const crow::request &request,
                                    const std::string &token) {
  auto target = ctx.codec->decode(token);
  if (!target || !is_valid_http_url(*target)) {
    CROW_LOG_INFO << "Proxy: rejected an undecodable token";
    return html_response(
        400, error_page_html("Invalid URL",
                             "This link is invalid or has expired."));
  }

  // HTTP method name
  std::string method_name;
  if (request.method == crow::HTTPMethod::Post) method_name = "POST";
  else method_name = "GET";

  CROW_LOG_INFO << "Proxy " << method_name << ": " << *target;

  FetchRequest fetch = ctx.make_fetch_request(*target, ctx.proxy_timeout_ms);
  fetch.method = method_name;
  if (method_name == "POST") {
    fetch.body = request.body;
    fetch.content_type = request.get_header_value("Content-Type");
    if (fetch.content_type.empty()) {
      fetch.content_type = "application/x-www-form-urlencoded";
    }
  }
  forward_client_headers(request, fetch);

  FetchResult result = fetch_url(fetch);
  if (!result.ok()) {
    CROW_LOG_WARNING << "Proxy error for " << *target << ": "
                     << result.error_message;
    const int code = result.error == FetchError::Timeout ? 504 : 502;
    return html_response(code, error_page_html(describe_fetch_error(result.error),
                                               result.error_message));
  }

  const UpstreamResponse &upstream = result.response;
  if (!is_success(upstream)) {
    CROW_LOG_WARNING << "Proxy: " << result.final_url << " answered HTTP "
                     << upstream.status_code;
    return html_response(
        502, error_page_html("Failed to load",
                             "HTTP " + std::to_string(upstream.status_code)));
  }

  const std::string content_type_lower = to_lower(upstream.content_type);
  crow::response resp;
  resp.code = upstream.status_code;

  if (content_type_lower.find("text/html") != std::string::npos) {
    resp.body = ctx.rewriter->rewrite(upstream.body, result.final_url,
                                      DocumentMode::Html);
    resp.set_header("Content-Type", "text/html; charset=utf-8");
  } else {
    resp.body = upstream.body;
    if (!upstream.content_type.empty()) {
      resp.set_header("Content-Type", upstream.content_type);
    }
    if (is_cacheable_type(content_type_lower)) {
      resp.set_header("Cache-Control", kAssetCacheControl);
    }
  }
  return resp;
}

crow::response handle_image_request(AppContext &ctx,
                                    const crow::request &request,
                                    const std::string &token) {
  auto target = ctx.codec->decode(token);
  if (!target || !is_valid_http_url(*target)) {
    CROW_LOG_DEBUG << "Image: undecodable token, serving placeholder";
    return placeholder_image_response();
  }

  FetchRequest fetch = ctx.make_fetch_request(*target, ctx.image_timeout_ms);
  fetch.accept = "image/avif,image/webp,image/*,*/*;q=0.8";
  fetch.referer = referer_for(*target);
  forward_client_headers(request, fetch);

  FetchResult result = fetch_url(fetch);
  if (!result.ok() || !is_success(result.response)) {
    CROW_LOG_WARNING << "Image proxy error for " << *target << ": "
                     << (result.ok() ? "HTTP " + std::to_string(
                                                     result.response.status_code)
                                     : result.error_message);
    return placeholder_image_response();
  }

  crow::response resp(200, result.response.body);
  resp.set_header("Content-Type", result.response.content_type.empty()
                                      ? std::string("application/octet-stream")
                                      : result.response.content_type);
  resp.set_header("Cache-Control", kAssetCacheControl);
  return resp;
}

crow::response handle_asset_request(AppContext &ctx,
                                    const crow::request &request,
                                    const std::string &token) {
  auto target = ctx.codec->decode(token);
  if (!target || !is_valid_http_url(*target)) {
    CROW_LOG_DEBUG << "Asset: undecodable token";
    return crow::response(404, "");
  }

  FetchRequest fetch = ctx.make_fetch_request(*target, ctx.asset_timeout_ms);
  fetch.accept = "*/*";
  fetch.referer = referer_for(*target);
  forward_client_headers(request, fetch);

  FetchResult result = fetch_url(fetch);
  if (!result.ok() || !is_success(result.response)) {
    CROW_LOG_WARNING << "Asset proxy error for " << *target << ": "
                     << (result.ok() ? "HTTP " + std::to_string(
                                                     result.response.status_code)
                                     : result.error_message);
    return crow::response(404, "");
  }

  const UpstreamResponse &upstream = result.response;
  crow::response resp;
  resp.code = 200;
  if (to_lower(upstream.content_type).find("text/css") != std::string::npos) {
    resp.body = ctx.rewriter->rewrite(upstream.body, result.final_url,
                                      DocumentMode::Css);
  } else {
    resp.body = upstream.body;
  }
  if (!upstream.content_type.empty()) {
    resp.set_header("Content-Type", upstream.content_type);
  }
  resp.set_header("Cache-Control", kAssetCacheControl);
  return resp;
}

// ═══════════════════════════════════════════════════════════════════════
//  Route registration
// ═══════════════════════════════════════════════════════════════════════

void register_proxy_routes(CrowApp &app, AppContext &ctx) {
  CROW_ROUTE(app, "/proxy/<string>")
      .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post)
      ([&ctx](const crow::request &request, std::string token) {
        return handle_proxy_request(ctx, request, token);
      });

  CROW_ROUTE(app, "/image/<string>")
      .methods(crow::HTTPMethod::Get)
      ([&ctx](const crow::request &request, std::string token) {
        return handle_image_request(ctx, request, token);
      });

  CROW_ROUTE(app, "/asset/<string>")
      .methods(crow::HTTPMethod::Get)
      ([&ctx](const crow::request &request, std::string token) {
        return handle_asset_request(ctx, request, token);
      });
}
