#pragma once
// ─── VeilProxy — Data models ────────────────────────────────────────────
// Pure data structures used across the application.

#include <cstddef>
#include <string>
#include <unordered_map>

// Outbound fetch failure classes.  `None` means the fetch produced a
// response (whatever its HTTP status).
enum class FetchError {
  None,
  Timeout,
  NotFound,     // DNS resolution failed
  Refused,      // TCP connection refused
  Unreachable,  // other connect / network failure
  Tls,
  Protocol,     // malformed HTTP response
  TooLarge,
};

// One outbound request.  Well-known headers have their own fields;
// anything else goes through `extra_headers` untouched.
struct FetchRequest {
  std::string method = "GET";
  std::string url;
  std::string body;
  std::string content_type;
  std::string user_agent =
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";
  std::string accept = "text/html,application/xhtml+xml,*/*;q=0.9";
  std::string referer;
  std::unordered_map<std::string, std::string> extra_headers;
  int timeout_ms = 8000;
  int max_redirects = 5;
  size_t max_body_bytes = 16 * 1024 * 1024;
  bool verify_tls = true;
};

// Parsed upstream response.  Header names are lower-cased; repeated
// headers are joined with ", ".
struct UpstreamResponse {
  int status_code = 0;
  std::string content_type;
  std::string location;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

struct FetchResult {
  FetchError error = FetchError::None;
  std::string error_message;
  std::string final_url;  // after redirects
  UpstreamResponse response;

  bool ok() const { return error == FetchError::None; }
};
