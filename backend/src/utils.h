#pragma once
// ─── VeilProxy — Utility functions ──────────────────────────────────────
// Small standalone helpers (header-only).

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

inline std::string html_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    switch (ch) {
      case '&':  out += "&amp;";  break;
      case '<':  out += "&lt;";   break;
      case '>':  out += "&gt;";   break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&#39;";  break;
      default:   out += ch;       break;
    }
  }
  return out;
}

inline std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

inline bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

inline bool starts_with_ci(const std::string &value, const std::string &prefix) {
  if (value.size() < prefix.size()) return false;
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(value[i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

inline std::string trim_copy(const std::string &value) {
  size_t start = 0;
  while (start < value.size() &&
         std::isspace(static_cast<unsigned char>(value[start]))) ++start;
  size_t e = value.size();
  while (e > start &&
         std::isspace(static_cast<unsigned char>(value[e - 1]))) --e;
  return value.substr(start, e - start);
}

inline void append_utf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Decodes the character references that show up in URL attributes:
// the five XML named entities, &nbsp;, and decimal/hex numeric forms.
// Anything unrecognised is copied through.
inline std::string decode_html_entities(const std::string &value) {
  if (value.find('&') == std::string::npos) return value;
  std::string out;
  out.reserve(value.size());
  size_t i = 0;
  while (i < value.size()) {
    if (value[i] != '&') {
      out += value[i++];
      continue;
    }
    size_t semi = value.find(';', i + 1);
    if (semi == std::string::npos || semi - i > 10) {
      out += value[i++];
      continue;
    }
    std::string name = value.substr(i + 1, semi - i - 1);
    bool decoded = true;
    if (name == "amp") out += '&';
    else if (name == "lt") out += '<';
    else if (name == "gt") out += '>';
    else if (name == "quot") out += '"';
    else if (name == "apos") out += '\'';
    else if (name == "nbsp") append_utf8(out, 0xA0);
    else if (name.size() > 1 && name[0] == '#') {
      bool hex = name[1] == 'x' || name[1] == 'X';
      std::string digits = name.substr(hex ? 2 : 1);
      bool all_digits = !digits.empty() &&
          std::all_of(digits.begin(), digits.end(), [hex](unsigned char ch) {
            return hex ? std::isxdigit(ch) != 0 : std::isdigit(ch) != 0;
          });
      if (all_digits) {
        uint32_t cp = static_cast<uint32_t>(
            std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10));
        if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
          cp = 0xFFFD;
        }
        append_utf8(out, cp);
      } else {
        decoded = false;
      }
    } else {
      decoded = false;
    }
    if (decoded) {
      i = semi + 1;
    } else {
      out += value[i++];
    }
  }
  return out;
}

// Integer environment variable; std::nullopt when unset or unparsable.
inline std::optional<long> env_long(const char *name) {
  const char *raw = std::getenv(name);
  if (!raw || !*raw) return std::nullopt;
  try {
    size_t used = 0;
    long value = std::stol(raw, &used);
    if (used != std::string(raw).size()) return std::nullopt;
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}
