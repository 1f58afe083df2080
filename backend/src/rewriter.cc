// ─── VeilProxy — Document rewriter implementation ───────────────────────

#include "rewriter.h"
#include "templates.h"
#include "url.h"
#include "utils.h"
#include "crow.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

bool is_tag_name_char(char c) {
  unsigned char uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || c == '-' || c == ':' || c == '_';
}

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool is_raw_text_element(const std::string &name) {
  return name == "script" || name == "style" || name == "textarea" ||
         name == "title";
}

// Finds `</name` (case-insensitive) at or after `from`.
size_t find_closing_tag(const std::string &doc, const std::string &name,
                        size_t from) {
  size_t pos = from;
  while ((pos = doc.find("</", pos)) != std::string::npos) {
    if (pos + 2 + name.size() <= doc.size() &&
        to_lower(doc.substr(pos + 2, name.size())) == name) {
      size_t after = pos + 2 + name.size();
      if (after == doc.size() || !is_tag_name_char(doc[after])) return pos;
    }
    pos += 2;
  }
  return std::string::npos;
}

bool rel_has_stylesheet(const HtmlTag &tag) {
  const HtmlAttribute *rel = tag.find_attribute("rel");
  if (!rel) return false;
  std::istringstream tokens(to_lower(rel->value));
  std::string token;
  while (tokens >> token) {
    if (token == "stylesheet") return true;
  }
  return false;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════
//  Rule table
// ═══════════════════════════════════════════════════════════════════════

const std::vector<RewriteRule> &rewrite_rules() {
  static const std::vector<RewriteRule> rules = {
      {"a", "href", {"javascript:", "#", "mailto:"}, false, "/proxy/"},
      {"form", "action", {"#"}, false, "/proxy/"},
      {"img", "src", {"data:"}, false, "/image/"},
      {"link", "href", {}, true, "/asset/"},
      {"script", "src", {}, false, "/asset/"},
  };
  return rules;
}

// ═══════════════════════════════════════════════════════════════════════
//  HTML scanning
// ═══════════════════════════════════════════════════════════════════════

const HtmlAttribute *HtmlTag::find_attribute(const std::string &attr) const {
  for (const auto &attribute : attributes) {
    if (attribute.name == attr) return &attribute;
  }
  return nullptr;
}

HtmlScan scan_html(const std::string &doc) {
  HtmlScan scan;
  const size_t n = doc.size();
  size_t i = 0;

  while (i < n) {
    size_t lt = doc.find('<', i);
    if (lt == std::string::npos || lt + 1 >= n) break;
    i = lt;

    // Comments, doctype, processing instructions.
    if (doc.compare(i, 4, "<!--") == 0) {
      size_t close = doc.find("-->", i + 4);
      if (close == std::string::npos) {
        scan.complete = false;
        break;
      }
      i = close + 3;
      continue;
    }
    if (doc[i + 1] == '!' || doc[i + 1] == '?') {
      size_t close = doc.find('>', i + 2);
      if (close == std::string::npos) {
        scan.complete = false;
        break;
      }
      i = close + 1;
      continue;
    }

    HtmlTag tag;
    tag.start = i;
    size_t p = i + 1;
    if (doc[p] == '/') {
      tag.closing = true;
      ++p;
    }
    if (p >= n || !std::isalpha(static_cast<unsigned char>(doc[p]))) {
      // A stray '<' in text.
      i = lt + 1;
      continue;
    }
    size_t name_start = p;
    while (p < n && is_tag_name_char(doc[p])) ++p;
    tag.name = to_lower(doc.substr(name_start, p - name_start));

    // Attributes.
    bool terminated = false;
    bool broken = false;
    while (p < n) {
      while (p < n && (is_space(doc[p]) || doc[p] == '/')) ++p;
      if (p >= n) break;
      if (doc[p] == '>') {
        terminated = true;
        ++p;
        break;
      }

      HtmlAttribute attribute;
      size_t attr_start = p;
      while (p < n && !is_space(doc[p]) && doc[p] != '=' && doc[p] != '>' &&
             doc[p] != '/') {
        ++p;
      }
      if (p == attr_start) {
        // Lone '=' or similar junk; step over it.
        ++p;
        continue;
      }
      attribute.name = to_lower(doc.substr(attr_start, p - attr_start));

      size_t q = p;
      while (q < n && is_space(doc[q])) ++q;
      if (q < n && doc[q] == '=') {
        ++q;
        while (q < n && is_space(doc[q])) ++q;
        if (q >= n) break;
        attribute.has_value = true;
        if (doc[q] == '"' || doc[q] == '\'') {
          char quote = doc[q];
          size_t close = doc.find(quote, q + 1);
          if (close == std::string::npos) {
            broken = true;
            break;
          }
          attribute.value = doc.substr(q + 1, close - q - 1);
          attribute.span_offset = q;
          attribute.span_length = close - q + 1;
          p = close + 1;
        } else {
          size_t value_start = q;
          while (q < n && !is_space(doc[q]) && doc[q] != '>') ++q;
          attribute.value = doc.substr(value_start, q - value_start);
          attribute.span_offset = value_start;
          attribute.span_length = q - value_start;
          p = q;
        }
      }
      tag.attributes.push_back(std::move(attribute));
    }

    if (broken || !terminated) {
      scan.complete = false;
      break;
    }
    tag.end = p;
    i = p;

    if (!tag.closing && is_raw_text_element(tag.name)) {
      size_t close = find_closing_tag(doc, tag.name, tag.end);
      tag.content_begin = tag.end;
      tag.content_end = (close == std::string::npos) ? n : close;
      i = tag.content_end;
    }
    scan.tags.push_back(std::move(tag));
  }
  return scan;
}

std::string apply_patches(const std::string &document,
                          std::vector<RewritePatch> patches) {
  std::stable_sort(patches.begin(), patches.end(),
                   [](const RewritePatch &a, const RewritePatch &b) {
                     return a.offset < b.offset;
                   });
  std::string out;
  out.reserve(document.size() + patches.size() * 64);
  size_t cursor = 0;
  for (const auto &patch : patches) {
    if (patch.offset < cursor || patch.offset > document.size()) continue;
    out.append(document, cursor, patch.offset - cursor);
    out += patch.replacement;
    cursor = std::min(document.size(), patch.offset + patch.length);
  }
  out.append(document, cursor, std::string::npos);
  return out;
}

// ═══════════════════════════════════════════════════════════════════════
//  DocumentRewriter
// ═══════════════════════════════════════════════════════════════════════

DocumentRewriter::DocumentRewriter(const crypto::TokenCodec &codec,
                                   bool inject_overlay)
    : codec_(codec), inject_overlay_(inject_overlay) {}

std::string DocumentRewriter::rewrite(const std::string &document,
                                      const std::string &base_url,
                                      DocumentMode mode) const {
  if (mode == DocumentMode::Css) return rewrite_css(document, base_url);
  return rewrite_html(document, base_url);
}

ReferenceRewrite DocumentRewriter::rewrite_reference(
    const std::string &value, const std::string &base_url,
    const std::string &route_prefix) const {
  ReferenceRewrite result;
  auto absolute = resolve_reference(base_url, value);
  if (!absolute || !is_valid_http_url(*absolute)) return result;
  try {
    result.value = route_prefix + codec_.encode(*absolute);
    result.outcome = RewriteOutcome::Rewritten;
  } catch (const crypto::CodecError &e) {
    CROW_LOG_WARNING << "Rewrite: cannot encode " << *absolute << ": "
                     << e.what();
    result.outcome = RewriteOutcome::Failed;
  }
  return result;
}

ReferenceRewrite DocumentRewriter::apply_rule(const RewriteRule &rule,
                                              const std::string &raw_value,
                                              const std::string &base_url) const {
  std::string value = trim_copy(decode_html_entities(raw_value));
  if (value.empty()) return {};
  for (const auto &prefix : rule.skip_prefixes) {
    if (starts_with_ci(value, prefix)) return {};
  }
  return rewrite_reference(value, base_url, rule.route_prefix);
}

std::string DocumentRewriter::rewrite_html(const std::string &html,
                                           const std::string &base_url) const {
  if (html.empty()) return html;
  try {
    HtmlScan scan = scan_html(html);
    std::vector<RewritePatch> patches;
    size_t rewritten = 0;
    size_t failed = 0;
    const HtmlTag *body_open = nullptr;
    const HtmlTag *head_close = nullptr;

    for (const auto &tag : scan.tags) {
      if (tag.closing) {
        if (tag.name == "head" && !head_close) head_close = &tag;
        continue;
      }
      if (tag.name == "body" && !body_open) body_open = &tag;

      if (tag.name == "style" && tag.content_end > tag.content_begin) {
        std::string css =
            html.substr(tag.content_begin, tag.content_end - tag.content_begin);
        std::string rewritten_css = rewrite_css(css, base_url);
        if (rewritten_css != css) {
          patches.push_back({tag.content_begin, css.size(), rewritten_css});
        }
      }

      for (const auto &rule : rewrite_rules()) {
        if (tag.name != rule.tag) continue;
        if (rule.stylesheet_only && !rel_has_stylesheet(tag)) continue;
        const HtmlAttribute *attribute = tag.find_attribute(rule.attribute);
        if (!attribute || !attribute->has_value) continue;

        ReferenceRewrite result = apply_rule(rule, attribute->value, base_url);
        if (result.outcome == RewriteOutcome::Rewritten) {
          patches.push_back({attribute->span_offset, attribute->span_length,
                             "\"" + result.value + "\""});
          ++rewritten;
        } else if (result.outcome == RewriteOutcome::Failed) {
          ++failed;
        }
      }
    }

    if (inject_overlay_) {
      const size_t overlay_at = body_open ? body_open->end : html.size();
      const size_t head_at = head_close ? head_close->start : overlay_at;
      patches.push_back({head_at, 0, overlay_head_markup()});
      patches.push_back({overlay_at, 0, overlay_body_markup()});
    }

    if (!scan.complete) {
      CROW_LOG_DEBUG << "Rewrite: markup of " << base_url
                     << " ends in a broken tag; tail kept verbatim";
    }
    CROW_LOG_DEBUG << "Rewrite: " << base_url << " rewritten=" << rewritten
                   << " failed=" << failed;
    return apply_patches(html, std::move(patches));
  } catch (const std::exception &e) {
    CROW_LOG_WARNING << "Rewrite: HTML pass aborted for " << base_url << ": "
                     << e.what();
    return html;
  }
}

std::string DocumentRewriter::rewrite_css(const std::string &css,
                                          const std::string &base_url) const {
  if (css.empty()) return css;
  try {
    std::vector<RewritePatch> patches;
    const std::string lower = to_lower(css);
    size_t pos = 0;
    while ((pos = lower.find("url(", pos)) != std::string::npos) {
      size_t start = pos;
      size_t p = pos + 4;
      pos = p;
      while (p < css.size() && is_space(css[p])) ++p;
      if (p >= css.size()) break;

      std::string value;
      if (css[p] == '"' || css[p] == '\'') {
        char quote = css[p];
        size_t close = css.find(quote, p + 1);
        if (close == std::string::npos) continue;
        value = css.substr(p + 1, close - p - 1);
        p = close + 1;
        while (p < css.size() && is_space(css[p])) ++p;
        if (p >= css.size() || css[p] != ')') continue;
      } else {
        size_t close = css.find(')', p);
        if (close == std::string::npos) continue;
        value = trim_copy(css.substr(p, close - p));
        p = close;
      }

      if (value.empty() || value[0] == '#' || starts_with_ci(value, "http") ||
          starts_with_ci(value, "data:")) {
        pos = p + 1;
        continue;
      }

      ReferenceRewrite result = rewrite_reference(value, base_url, "/asset/");
      if (result.outcome == RewriteOutcome::Rewritten) {
        patches.push_back({start, p + 1 - start, "url('" + result.value + "')"});
      }
      pos = p + 1;
    }
    return apply_patches(css, std::move(patches));
  } catch (const std::exception &e) {
    CROW_LOG_WARNING << "Rewrite: CSS pass aborted for " << base_url << ": "
                     << e.what();
    return css;
  }
}
