#pragma once
// ─── VeilProxy — Search box classification ──────────────────────────────

#include <string>

enum class SearchKind { AbsoluteUrl, BareDomain, FreeText };

struct SearchResolution {
  SearchKind kind = SearchKind::FreeText;
  std::string url;
};

constexpr const char kDefaultSearchUrl[] = "https://www.google.com/search?q=";

// Turns what a user typed into a destination URL:
//   "https://example.org/a?b=1" -> unchanged
//   "openai.com"                -> "https://www.openai.com"
//   "www.openai.com"            -> "https://www.openai.com"
//   "weather today"             -> search_base + "weather%20today"
// `query` is trimmed first.  The result is not validated.
SearchResolution resolve_search_query(const std::string &query,
                                      const std::string &search_base =
                                          kDefaultSearchUrl);
