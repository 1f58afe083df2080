// ─── VeilProxy — URL parsing and reference resolution ───────────────────

#include "url.h"
#include "utils.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace {

bool is_scheme_char(char c, bool first) {
  unsigned char uc = static_cast<unsigned char>(c);
  if (std::isalpha(uc)) return true;
  if (first) return false;
  return std::isdigit(uc) || c == '+' || c == '-' || c == '.';
}

// Length of a leading `scheme:` (including the colon), or 0.
size_t scheme_length(const std::string &text) {
  if (text.empty() || !is_scheme_char(text[0], true)) return 0;
  size_t i = 1;
  while (i < text.size() && is_scheme_char(text[i], false)) ++i;
  if (i < text.size() && text[i] == ':') return i + 1;
  return 0;
}

bool is_special_scheme(const std::string &scheme) {
  return scheme == "http" || scheme == "https";
}

std::string default_port_for(const std::string &scheme) {
  if (scheme == "http") return "80";
  if (scheme == "https") return "443";
  return "";
}

bool is_host_char(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '%' ||
         c == '~' || c >= 0x80;
}

// Characters a browser would percent-encode before resolving.
std::string escape_reference(const std::string &ref) {
  std::string out;
  out.reserve(ref.size());
  for (char ch : ref) {
    switch (ch) {
      case ' ': out += "%20"; break;
      case '"': out += "%22"; break;
      case '<': out += "%3C"; break;
      case '>': out += "%3E"; break;
      case '`': out += "%60"; break;
      default:  out += ch;    break;
    }
  }
  return out;
}

// Trims C0/space at both ends and drops tab/CR/LF everywhere, like the
// URL parser in browsers.
std::string clean_reference(const std::string &ref) {
  size_t start = 0;
  size_t end = ref.size();
  while (start < end && static_cast<unsigned char>(ref[start]) <= 0x20) ++start;
  while (end > start && static_cast<unsigned char>(ref[end - 1]) <= 0x20) --end;
  std::string out;
  out.reserve(end - start);
  for (size_t i = start; i < end; ++i) {
    char ch = ref[i];
    if (ch == '\t' || ch == '\n' || ch == '\r') continue;
    out += ch;
  }
  return out;
}

struct RelativeParts {
  std::string path;
  std::string query;
  std::string fragment;
  bool has_query = false;
  bool has_fragment = false;
};

RelativeParts split_relative(const std::string &ref) {
  RelativeParts parts;
  std::string rest = ref;
  size_t hash = rest.find('#');
  if (hash != std::string::npos) {
    parts.fragment = rest.substr(hash + 1);
    parts.has_fragment = true;
    rest = rest.substr(0, hash);
  }
  size_t qmark = rest.find('?');
  if (qmark != std::string::npos) {
    parts.query = rest.substr(qmark + 1);
    parts.has_query = true;
    rest = rest.substr(0, qmark);
  }
  parts.path = rest;
  return parts;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════
//  Url
// ═══════════════════════════════════════════════════════════════════════

int Url::effective_port() const {
  if (!port.empty()) return std::stoi(port);
  return scheme == "https" ? 443 : 80;
}

std::string Url::host_port() const {
  if (port.empty()) return host;
  return host + ":" + port;
}

std::string Url::origin() const { return scheme + "://" + host_port(); }

std::string Url::request_target() const {
  std::string target = path.empty() ? "/" : path;
  if (has_query) target += "?" + query;
  return target;
}

std::string Url::serialize() const {
  std::string out = scheme + "://";
  if (!userinfo.empty()) out += userinfo + "@";
  out += host_port();
  out += path.empty() ? "/" : path;
  if (has_query) out += "?" + query;
  if (has_fragment) out += "#" + fragment;
  return out;
}

// ═══════════════════════════════════════════════════════════════════════
//  Parsing
// ═══════════════════════════════════════════════════════════════════════

std::optional<Url> parse_absolute_url(const std::string &text) {
  for (unsigned char c : text) {
    if (c <= 0x20 || c == 0x7F) return std::nullopt;
  }

  size_t scheme_len = scheme_length(text);
  if (scheme_len == 0) return std::nullopt;

  Url url;
  url.scheme = to_lower(text.substr(0, scheme_len - 1));
  std::string rest = text.substr(scheme_len);
  if (is_special_scheme(url.scheme)) {
    std::replace(rest.begin(),
                 rest.begin() + std::min(rest.find_first_of("?#"), rest.size()),
                 '\\', '/');
  }
  if (rest.rfind("//", 0) != 0) return std::nullopt;
  rest = rest.substr(2);

  size_t authority_end = rest.find_first_of("/?#");
  if (authority_end == std::string::npos) authority_end = rest.size();
  std::string authority = rest.substr(0, authority_end);
  rest = rest.substr(authority_end);

  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    url.userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
  }

  std::string host;
  std::string port;
  if (!authority.empty() && authority[0] == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos) return std::nullopt;
    host = authority.substr(0, close + 1);
    std::string after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after[0] != ':') return std::nullopt;
      port = after.substr(1);
    }
    for (size_t i = 1; i + 1 < host.size(); ++i) {
      unsigned char c = static_cast<unsigned char>(host[i]);
      if (!std::isxdigit(c) && c != ':' && c != '.') return std::nullopt;
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
      host = authority.substr(0, colon);
      port = authority.substr(colon + 1);
    } else {
      host = authority;
    }
    for (unsigned char c : host) {
      if (!is_host_char(c)) return std::nullopt;
    }
  }
  if (host.empty() || host == "[]") return std::nullopt;
  if (port.size() > 5) return std::nullopt;
  if (!std::all_of(port.begin(), port.end(),
                   [](unsigned char ch) { return std::isdigit(ch); })) {
    return std::nullopt;
  }
  if (!port.empty()) {
    int port_value = std::stoi(port);
    if (port_value > 65535) return std::nullopt;
    port = std::to_string(port_value);
    if (port == default_port_for(url.scheme)) port.clear();
  }
  url.host = to_lower(host);
  url.port = port;

  RelativeParts parts = split_relative(rest);
  url.path = parts.path.empty() ? "/" : remove_dot_segments(parts.path);
  url.query = parts.query;
  url.has_query = parts.has_query;
  url.fragment = parts.fragment;
  url.has_fragment = parts.has_fragment;
  return url;
}

std::string bare_host(const std::string &host) {
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    return host.substr(1, host.size() - 2);
  }
  return host;
}

bool is_ip_literal(const std::string &host) {
  const std::string bare = bare_host(host);
  unsigned char buf[sizeof(struct in6_addr)];
  return inet_pton(AF_INET, bare.c_str(), buf) == 1 ||
         inet_pton(AF_INET6, bare.c_str(), buf) == 1;
}

bool is_valid_http_url(const std::string &text) {
  auto url = parse_absolute_url(text);
  return url && is_special_scheme(url->scheme);
}

// ═══════════════════════════════════════════════════════════════════════
//  Resolution (RFC 3986 §5.2)
// ═══════════════════════════════════════════════════════════════════════

std::string remove_dot_segments(const std::string &path) {
  const bool absolute = !path.empty() && path[0] == '/';
  std::vector<std::string> segments;
  size_t pos = absolute ? 1 : 0;
  while (true) {
    size_t slash = path.find('/', pos);
    if (slash == std::string::npos) {
      segments.push_back(path.substr(pos));
      break;
    }
    segments.push_back(path.substr(pos, slash - pos));
    pos = slash + 1;
  }

  std::vector<std::string> output;
  for (size_t i = 0; i < segments.size(); ++i) {
    const bool last = i + 1 == segments.size();
    const std::string &segment = segments[i];
    if (segment == ".") {
      if (last) output.emplace_back();
      continue;
    }
    if (segment == "..") {
      if (!output.empty()) output.pop_back();
      if (last) output.emplace_back();
      continue;
    }
    output.push_back(segment);
  }

  std::string result = absolute ? "/" : "";
  for (size_t i = 0; i < output.size(); ++i) {
    if (i > 0) result += '/';
    result += output[i];
  }
  return result;
}

std::optional<std::string> resolve_reference(const std::string &base,
                                             const std::string &reference) {
  auto base_url = parse_absolute_url(base);
  if (!base_url) return std::nullopt;

  std::string ref = escape_reference(clean_reference(reference));

  size_t scheme_len = scheme_length(ref);
  if (scheme_len > 0) {
    auto absolute = parse_absolute_url(ref);
    if (!absolute) return std::nullopt;
    return absolute->serialize();
  }

  if (is_special_scheme(base_url->scheme)) {
    std::replace(ref.begin(),
                 ref.begin() + std::min(ref.find_first_of("?#"), ref.size()),
                 '\\', '/');
  }

  if (ref.rfind("//", 0) == 0) {
    auto absolute = parse_absolute_url(base_url->scheme + ":" + ref);
    if (!absolute) return std::nullopt;
    return absolute->serialize();
  }

  RelativeParts parts = split_relative(ref);
  Url target = *base_url;
  target.fragment = parts.fragment;
  target.has_fragment = parts.has_fragment;

  if (parts.path.empty()) {
    if (parts.has_query) {
      target.query = parts.query;
      target.has_query = true;
    }
  } else {
    if (parts.path[0] == '/') {
      target.path = remove_dot_segments(parts.path);
    } else {
      size_t last_slash = base_url->path.rfind('/');
      std::string merged =
          (last_slash == std::string::npos)
              ? "/" + parts.path
              : base_url->path.substr(0, last_slash + 1) + parts.path;
      target.path = remove_dot_segments(merged);
    }
    target.query = parts.query;
    target.has_query = parts.has_query;
  }

  for (unsigned char c : target.serialize()) {
    if (c <= 0x20 || c == 0x7F) return std::nullopt;
  }
  return target.serialize();
}

std::string percent_encode_component(const std::string &value) {
  static const char hex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' ||
        c == '~' || c == '*' || c == '\'' || c == '(' || c == ')') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += hex[c >> 4];
      out += hex[c & 0x0F];
    }
  }
  return out;
}
