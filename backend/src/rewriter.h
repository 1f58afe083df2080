#pragma once
// ─── VeilProxy — Document rewriter ──────────────────────────────────────
// Rewrites every outbound reference of a fetched HTML or CSS document so
// it routes back through the proxy as /proxy/, /image/ or /asset/ plus an
// encoded token.  Rewriting is best-effort: a reference that cannot be
// resolved or encoded is left as it was, and a document that cannot be
// scanned is returned unchanged.

#include "crypto.h"

#include <cstddef>
#include <string>
#include <vector>

enum class DocumentMode { Html, Css };

enum class RewriteOutcome {
  Rewritten,
  Skipped,  // skip-listed, empty, or not an http(s) destination
  Failed,   // the codec refused to encode
};

struct ReferenceRewrite {
  RewriteOutcome outcome = RewriteOutcome::Skipped;
  std::string value;  // replacement value when Rewritten
};

// Which markup construct gets rewritten, and to which proxy route.
struct RewriteRule {
  const char *tag;
  const char *attribute;
  std::vector<std::string> skip_prefixes;
  bool stylesheet_only;  // <link>: only rel="stylesheet"
  const char *route_prefix;
};

const std::vector<RewriteRule> &rewrite_rules();

// ── HTML scanning ──

struct HtmlAttribute {
  std::string name;        // lower-cased
  std::string value;       // raw, entities not decoded
  size_t span_offset = 0;  // value including its quotes
  size_t span_length = 0;
  bool has_value = false;
};

struct HtmlTag {
  std::string name;  // lower-cased
  bool closing = false;
  size_t start = 0;  // offset of '<'
  size_t end = 0;    // offset one past '>'
  std::vector<HtmlAttribute> attributes;
  // Raw-text content of <script>/<style>/<textarea>/<title>.
  size_t content_begin = 0;
  size_t content_end = 0;

  const HtmlAttribute *find_attribute(const std::string &attr) const;
};

struct HtmlScan {
  std::vector<HtmlTag> tags;
  bool complete = true;  // false when scanning stopped at broken markup
};

HtmlScan scan_html(const std::string &document);

// Replacement of [offset, offset+length) in the source document.
struct RewritePatch {
  size_t offset = 0;
  size_t length = 0;
  std::string replacement;
};

// Applies non-overlapping patches; patches at the same offset keep their
// relative order.
std::string apply_patches(const std::string &document,
                          std::vector<RewritePatch> patches);

class DocumentRewriter {
 public:
  explicit DocumentRewriter(const crypto::TokenCodec &codec,
                            bool inject_overlay = true);

  std::string rewrite(const std::string &document, const std::string &base_url,
                      DocumentMode mode) const;

  std::string rewrite_html(const std::string &html,
                           const std::string &base_url) const;
  std::string rewrite_css(const std::string &css,
                          const std::string &base_url) const;

  // Resolves `value` against `base_url` and encodes it behind
  // `route_prefix`.
  ReferenceRewrite rewrite_reference(const std::string &value,
                                     const std::string &base_url,
                                     const std::string &route_prefix) const;

 private:
  ReferenceRewrite apply_rule(const RewriteRule &rule,
                              const std::string &raw_value,
                              const std::string &base_url) const;

  const crypto::TokenCodec &codec_;
  bool inject_overlay_;
};
