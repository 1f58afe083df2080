// ─── VeilProxy — Document rewriter tests ────────────────────────────────

#include "crypto.h"
#include "rewriter.h"
#include "templates.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

class RewriterTest : public ::testing::Test {
 protected:
  RewriterTest() : codec_("rewriter-test-secret"), rewriter_(codec_, false) {}

  // Every "<prefix>TOKEN" occurrence in `document`, decoded.
  std::vector<std::string> decoded_targets(const std::string &document,
                                           const std::string &prefix) const {
    std::vector<std::string> targets;
    size_t pos = 0;
    while ((pos = document.find(prefix, pos)) != std::string::npos) {
      size_t start = pos + prefix.size();
      size_t end = document.find_first_not_of("0123456789abcdef:", start);
      if (end == std::string::npos) end = document.size();
      auto url = codec_.decode(document.substr(start, end - start));
      targets.push_back(url.value_or("<undecodable>"));
      pos = end;
    }
    return targets;
  }

  crypto::TokenCodec codec_;
  DocumentRewriter rewriter_;
};

TEST_F(RewriterTest, RewritesEveryReferenceKind) {
  const std::string html =
      "<html><head>"
      "<link rel=\"stylesheet\" href=\"/css/site.css\">"
      "<script src=\"js/app.js\"></script>"
      "</head><body>"
      "<a href=\"page2.html\">next</a>"
      "<img src=\"//cdn.example.net/logo.png\">"
      "<form action=\"/search\" method=\"get\"></form>"
      "</body></html>";
  const std::string out =
      rewriter_.rewrite(html, "https://example.com/dir/index.html",
                        DocumentMode::Html);

  EXPECT_EQ(decoded_targets(out, "/asset/"),
            (std::vector<std::string>{"https://example.com/css/site.css",
                                      "https://example.com/dir/js/app.js"}));
  EXPECT_EQ(decoded_targets(out, "/proxy/"),
            (std::vector<std::string>{"https://example.com/dir/page2.html",
                                      "https://example.com/search"}));
  EXPECT_EQ(decoded_targets(out, "/image/"),
            (std::vector<std::string>{"https://cdn.example.net/logo.png"}));
  EXPECT_EQ(out.find("page2.html"), std::string::npos);
  EXPECT_NE(out.find("method=\"get\""), std::string::npos);
}

TEST_F(RewriterTest, LeavesSkipListedReferencesAlone) {
  const std::string html =
      "<a href=\"javascript:void(0)\">js</a>"
      "<a href=\"#section\">anchor</a>"
      "<a href=\"mailto:someone@example.com\">mail</a>"
      "<a href=\"JavaScript:alert(1)\">upper</a>"
      "<form action=\"#\"></form>"
      "<img src=\"data:image/png;base64,AAAA\">"
      "<a>no href</a><a href=\"\">empty</a>";
  const std::string out =
      rewriter_.rewrite(html, "https://example.com/", DocumentMode::Html);
  EXPECT_EQ(out, html);
}

TEST_F(RewriterTest, OnlyStylesheetLinksAreRewritten) {
  const std::string html =
      "<link rel=\"icon\" href=\"/favicon.ico\">"
      "<link rel=\"alternate stylesheet\" href=\"/alt.css\">";
  const std::string out =
      rewriter_.rewrite(html, "https://example.com/", DocumentMode::Html);
  EXPECT_NE(out.find("href=\"/favicon.ico\""), std::string::npos);
  EXPECT_EQ(decoded_targets(out, "/asset/"),
            (std::vector<std::string>{"https://example.com/alt.css"}));
}

TEST_F(RewriterTest, DecodesEntitiesAndHandlesQuoting) {
  const std::string html =
      "<a href='/q?a=1&amp;b=2'>x</a><a href=/plain>y</a>";
  const std::string out =
      rewriter_.rewrite(html, "http://example.org/", DocumentMode::Html);
  EXPECT_EQ(decoded_targets(out, "/proxy/"),
            (std::vector<std::string>{"http://example.org/q?a=1&b=2",
                                      "http://example.org/plain"}));
  EXPECT_NE(out.find("href=\"/proxy/"), std::string::npos);
}

TEST_F(RewriterTest, IgnoresMarkupInsideScriptsAndComments) {
  const std::string html =
      "<script>var s = '<a href=\"/inside\">';</script>"
      "<!-- <a href=\"/commented\"> -->"
      "<a href=\"/outside\">ok</a>";
  const std::string out =
      rewriter_.rewrite(html, "https://example.com/", DocumentMode::Html);
  EXPECT_NE(out.find("href=\"/inside\""), std::string::npos);
  EXPECT_NE(out.find("href=\"/commented\""), std::string::npos);
  EXPECT_EQ(decoded_targets(out, "/proxy/"),
            (std::vector<std::string>{"https://example.com/outside"}));
}

TEST_F(RewriterTest, BrokenMarkupKeepsTailVerbatim) {
  const std::string html = "<a href=\"/ok\">fine</a><img src=\"/broken";
  const std::string out =
      rewriter_.rewrite(html, "https://example.com/", DocumentMode::Html);
  EXPECT_EQ(decoded_targets(out, "/proxy/"),
            (std::vector<std::string>{"https://example.com/ok"}));
  EXPECT_NE(out.find("<img src=\"/broken"), std::string::npos);
}

TEST_F(RewriterTest, EmptyAndInvalidBaseAreHarmless) {
  EXPECT_EQ(rewriter_.rewrite("", "https://example.com/", DocumentMode::Html), "");
  const std::string html = "<a href=\"page\">x</a>";
  EXPECT_EQ(rewriter_.rewrite(html, "not a base", DocumentMode::Html), html);
}

TEST_F(RewriterTest, CssUrlsResolveAgainstStylesheet) {
  const std::string css = "body { background: url(../img/x.png) no-repeat; }";
  const std::string out =
      rewriter_.rewrite(css, "https://example.com/css/", DocumentMode::Css);
  EXPECT_EQ(decoded_targets(out, "/asset/"),
            (std::vector<std::string>{"https://example.com/img/x.png"}));
  EXPECT_NE(out.find("url('/asset/"), std::string::npos);
  EXPECT_NE(out.find("no-repeat"), std::string::npos);
}

TEST_F(RewriterTest, CssSkipsAbsoluteDataAndFragmentUrls) {
  const std::string css =
      "a{background:url(\"https://cdn.example.net/a.png\")}"
      "b{background:URL('data:image/gif;base64,R0lG')}"
      "c{filter:url(#blur)}"
      "d{background:url()}";
  EXPECT_EQ(rewriter_.rewrite(css, "https://example.com/", DocumentMode::Css),
            css);
}

TEST_F(RewriterTest, CssQuotedRelativeUrls) {
  const std::string css = "@font-face{src:url( \"fonts/a.woff2\" )}";
  const std::string out =
      rewriter_.rewrite(css, "https://example.com/static/", DocumentMode::Css);
  EXPECT_EQ(decoded_targets(out, "/asset/"),
            (std::vector<std::string>{"https://example.com/static/fonts/a.woff2"}));
}

TEST_F(RewriterTest, StyleBlocksGetCssRewrite) {
  const std::string html =
      "<style>.hero{background:url(hero.jpg)}</style><p>text</p>";
  const std::string out =
      rewriter_.rewrite(html, "https://example.com/home/", DocumentMode::Html);
  EXPECT_EQ(decoded_targets(out, "/asset/"),
            (std::vector<std::string>{"https://example.com/home/hero.jpg"}));
  EXPECT_NE(out.find("<p>text</p>"), std::string::npos);
}

TEST_F(RewriterTest, RewriteReferenceReportsOutcome) {
  auto skipped =
      rewriter_.rewrite_reference("ftp://example.com/f", "https://example.com/", "/proxy/");
  EXPECT_EQ(skipped.outcome, RewriteOutcome::Skipped);

  auto rewritten =
      rewriter_.rewrite_reference("a b", "https://example.com/", "/proxy/");
  ASSERT_EQ(rewritten.outcome, RewriteOutcome::Rewritten);
  EXPECT_EQ(decoded_targets(rewritten.value, "/proxy/"),
            (std::vector<std::string>{"https://example.com/a%20b"}));
}

TEST(RewriterOverlayTest, InjectsOverlayIntoHeadAndBody) {
  crypto::TokenCodec codec("overlay-secret");
  DocumentRewriter rewriter(codec, true);
  const std::string html =
      "<html><head><title>t</title></head><body class=\"x\"><p>hi</p></body></html>";
  const std::string out =
      rewriter.rewrite(html, "https://example.com/", DocumentMode::Html);

  const size_t head_markup = out.find(overlay_head_markup());
  const size_t body_markup = out.find(overlay_body_markup());
  ASSERT_NE(head_markup, std::string::npos);
  ASSERT_NE(body_markup, std::string::npos);
  EXPECT_LT(head_markup, out.find("</head>"));
  EXPECT_EQ(out.find("<body class=\"x\">") + std::string("<body class=\"x\">").size(),
            body_markup);
  EXPECT_NE(out.find("<p>hi</p>"), std::string::npos);
}

TEST(RewriterOverlayTest, AppendsOverlayWithoutBody) {
  crypto::TokenCodec codec("overlay-secret");
  DocumentRewriter rewriter(codec, true);
  const std::string out =
      rewriter.rewrite("<p>fragment</p>", "https://example.com/", DocumentMode::Html);
  EXPECT_EQ(out.rfind(overlay_body_markup()),
            out.size() - overlay_body_markup().size());
  EXPECT_EQ(out.find("<p>fragment</p>"), 0u);
}

TEST(ApplyPatchesTest, AppliesInOffsetOrder) {
  std::vector<RewritePatch> patches = {{6, 5, "there"}, {0, 5, "Hi"}, {11, 0, "!"}};
  EXPECT_EQ(apply_patches("hello world", patches), "Hi there!");
}

TEST(ScanHtmlTest, RecordsAttributeSpans) {
  const std::string doc = "<A HREF = 'x' data-flag>";
  HtmlScan scan = scan_html(doc);
  ASSERT_TRUE(scan.complete);
  ASSERT_EQ(scan.tags.size(), 1u);
  const HtmlTag &tag = scan.tags[0];
  EXPECT_EQ(tag.name, "a");
  const HtmlAttribute *href = tag.find_attribute("href");
  ASSERT_NE(href, nullptr);
  EXPECT_EQ(href->value, "x");
  EXPECT_EQ(doc.substr(href->span_offset, href->span_length), "'x'");
  const HtmlAttribute *flag = tag.find_attribute("data-flag");
  ASSERT_NE(flag, nullptr);
  EXPECT_FALSE(flag->has_value);
}

}  // namespace
