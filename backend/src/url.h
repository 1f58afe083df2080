#pragma once
// ─── VeilProxy — URL parsing and reference resolution ───────────────────
// Absolute-URL parsing for http/https destinations and RFC 3986 §5.2
// resolution of the (possibly relative) references found in documents.

#include <optional>
#include <string>

struct Url {
  std::string scheme;    // lower-cased, without ':'
  std::string userinfo;  // without '@'
  std::string host;      // lower-cased; IPv6 literals keep their brackets
  std::string port;      // digits only, empty when absent or default
  std::string path = "/";
  std::string query;     // without '?'
  std::string fragment;  // without '#'
  bool has_query = false;
  bool has_fragment = false;

  int effective_port() const;
  std::string host_port() const;
  std::string origin() const;
  // Path and query, as sent on the request line.
  std::string request_target() const;
  std::string serialize() const;
};

// Parses `text` as an absolute hierarchical URL (`scheme://authority...`).
// Whitespace or control characters anywhere make the parse fail.
std::optional<Url> parse_absolute_url(const std::string &text);

// `host` without the brackets of an IPv6 literal.
std::string bare_host(const std::string &host);

// True for an IPv4 or IPv6 address literal, bracketed or not.
bool is_ip_literal(const std::string &host);

// True when `text` parses and its scheme is http or https.
bool is_valid_http_url(const std::string &text);

// Resolves `reference` against the absolute URL `base`.  Returns the
// serialized absolute URL, or std::nullopt when either side cannot be
// parsed.
std::optional<std::string> resolve_reference(const std::string &base,
                                             const std::string &reference);

std::string remove_dot_segments(const std::string &path);

// encodeURIComponent-compatible percent encoding.
std::string percent_encode_component(const std::string &value);
