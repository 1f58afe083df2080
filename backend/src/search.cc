// ─── VeilProxy — Search box classification ──────────────────────────────

#include "search.h"
#include "url.h"
#include "utils.h"

SearchResolution resolve_search_query(const std::string &query,
                                      const std::string &search_base) {
  const std::string trimmed = trim_copy(query);
  SearchResolution resolution;

  if (starts_with(trimmed, "http://") || starts_with(trimmed, "https://")) {
    resolution.kind = SearchKind::AbsoluteUrl;
    resolution.url = trimmed;
  } else if (trimmed.find('.') != std::string::npos &&
             trimmed.find(' ') == std::string::npos) {
    resolution.kind = SearchKind::BareDomain;
    resolution.url = starts_with(trimmed, "www.") ? "https://" + trimmed
                                                  : "https://www." + trimmed;
  } else {
    resolution.kind = SearchKind::FreeText;
    resolution.url = search_base + percent_encode_component(trimmed);
  }
  return resolution;
}
