// ─── VeilProxy — HTTP handler tests ─────────────────────────────────────

#include "app_context.h"
#include "http_proxy.h"
#include "routes.h"
#include "templates.h"
#include "test_server.h"

#include <gtest/gtest.h>

#include <string>

namespace {

class RoutesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ctx_.secret_key = "routes-test-secret";
    ctx_.proxy_timeout_ms = 2000;
    ctx_.image_timeout_ms = 2000;
    ctx_.asset_timeout_ms = 2000;
    ctx_.init_codec();
  }

  static crow::request post_json(const std::string &body) {
    crow::request request;
    request.method = crow::HTTPMethod::Post;
    request.body = body;
    request.add_header("Content-Type", "application/json");
    return request;
  }

  static crow::request get_request() {
    crow::request request;
    request.method = crow::HTTPMethod::Get;
    return request;
  }

  static std::string error_of(const crow::response &response) {
    auto body = crow::json::load(response.body);
    if (!body || !body.has("error")) return "<no error field>";
    return body["error"].s();
  }

  std::string token_for(const std::string &url) { return ctx_.codec->encode(url); }

  AppContext ctx_;
};

std::string html_ok(const std::string &body, const std::string &type = "text/html") {
  return "HTTP/1.1 200 OK\r\nContent-Type: " + type +
         "\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

// ── /api/encrypt-url ──

TEST_F(RoutesTest, EncryptUrlReturnsDecodableToken) {
  crow::response response =
      handle_encrypt_url(ctx_, post_json("{\"url\":\"https://example.com/a\"}"));
  ASSERT_EQ(response.code, 200);
  auto body = crow::json::load(response.body);
  ASSERT_TRUE(body);
  std::string token = body["encrypted"].s();
  EXPECT_EQ(ctx_.codec->decode(token).value_or(""), "https://example.com/a");
}

TEST_F(RoutesTest, EncryptUrlRejectsBadInput) {
  crow::response malformed = handle_encrypt_url(ctx_, post_json("{not json"));
  EXPECT_EQ(malformed.code, 400);
  EXPECT_EQ(error_of(malformed), "Invalid JSON body");

  crow::response missing = handle_encrypt_url(ctx_, post_json("{}"));
  EXPECT_EQ(missing.code, 400);
  EXPECT_EQ(error_of(missing), "Invalid URL");

  crow::response relative = handle_encrypt_url(ctx_, post_json("{\"url\":\"/a/b\"}"));
  EXPECT_EQ(relative.code, 400);
  EXPECT_EQ(error_of(relative), "Invalid URL");

  crow::response ftp =
      handle_encrypt_url(ctx_, post_json("{\"url\":\"ftp://example.com/\"}"));
  EXPECT_EQ(ftp.code, 400);
}

// ── /api/search ──

TEST_F(RoutesTest, SearchReturnsProxyPath) {
  crow::response response =
      handle_search(ctx_, post_json("{\"query\":\"weather today\"}"));
  ASSERT_EQ(response.code, 200);
  auto body = crow::json::load(response.body);
  ASSERT_TRUE(body);
  std::string url = body["url"].s();
  ASSERT_EQ(url.rfind("/proxy/", 0), 0u);
  EXPECT_EQ(ctx_.codec->decode(url.substr(7)).value_or(""),
            "https://www.google.com/search?q=weather%20today");
}

TEST_F(RoutesTest, SearchBareDomain) {
  crow::response response = handle_search(ctx_, post_json("{\"query\":\"openai.com\"}"));
  ASSERT_EQ(response.code, 200);
  auto body = crow::json::load(response.body);
  std::string url = body["url"].s();
  EXPECT_EQ(ctx_.codec->decode(url.substr(7)).value_or(""), "https://www.openai.com");
}

TEST_F(RoutesTest, SearchValidation) {
  crow::response missing = handle_search(ctx_, post_json("{}"));
  EXPECT_EQ(missing.code, 400);
  EXPECT_EQ(error_of(missing), "Query required");

  crow::response number = handle_search(ctx_, post_json("{\"query\":42}"));
  EXPECT_EQ(number.code, 400);
  EXPECT_EQ(error_of(number), "Query required");

  crow::response blank = handle_search(ctx_, post_json("{\"query\":\"   \"}"));
  EXPECT_EQ(blank.code, 400);
  EXPECT_EQ(error_of(blank), "Query cannot be empty");

  crow::response invalid =
      handle_search(ctx_, post_json("{\"query\":\"example.com:99999\"}"));
  EXPECT_EQ(invalid.code, 400);
  EXPECT_EQ(error_of(invalid), "Invalid URL");
}

TEST_F(RoutesTest, HealthReportsPresence) {
  ctx_.presence.join("visitor");
  crow::response response = handle_health(ctx_);
  ASSERT_EQ(response.code, 200);
  auto body = crow::json::load(response.body);
  ASSERT_TRUE(body);
  EXPECT_EQ(std::string(body["status"].s()), "ok");
  EXPECT_EQ(body["users"].i(), 1);
  EXPECT_FALSE(std::string(body["version"].s()).empty());
}

TEST_F(RoutesTest, ServerOptionsEnableGzip) {
  ctx_.port = 9099;
  CrowApp app;
  configure_server(app, ctx_);
  EXPECT_EQ(app.port(), 9099);
  EXPECT_TRUE(app.compression_used());
  EXPECT_EQ(app.compression_algorithm(), crow::compression::algorithm::GZIP);
}

TEST_F(RoutesTest, CompressionCanBeDisabled) {
  ctx_.compression = false;
  CrowApp app;
  configure_server(app, ctx_);
  EXPECT_FALSE(app.compression_used());
}

// ── Token routes: undecodable tokens ──

TEST_F(RoutesTest, BadTokenPresentations) {
  const std::string bad = "00:zz";

  crow::response page = handle_proxy_request(ctx_, get_request(), bad);
  EXPECT_EQ(page.code, 400);
  EXPECT_NE(page.body.find("Invalid URL"), std::string::npos);

  crow::response image = handle_image_request(ctx_, get_request(), bad);
  EXPECT_EQ(image.code, 200);
  EXPECT_EQ(image.get_header_value("Content-Type"), "image/png");
  EXPECT_EQ(image.body, placeholder_png());

  crow::response asset = handle_asset_request(ctx_, get_request(), bad);
  EXPECT_EQ(asset.code, 404);
  EXPECT_TRUE(asset.body.empty());
}

// ── Token routes against a loopback upstream ──

TEST_F(RoutesTest, ProxyRewritesHtml) {
  ScriptedServer server({html_ok("<html><head></head><body><a href=\"/next\">n</a></body></html>")});
  crow::response response =
      handle_proxy_request(ctx_, get_request(), token_for(server.url("/page")));
  ASSERT_EQ(response.code, 200);
  EXPECT_EQ(response.get_header_value("Content-Type"), "text/html; charset=utf-8");
  EXPECT_EQ(response.body.find("href=\"/next\""), std::string::npos);
  EXPECT_NE(response.body.find("href=\"/proxy/"), std::string::npos);
  EXPECT_NE(response.body.find(overlay_body_markup()), std::string::npos);
}

TEST_F(RoutesTest, ProxyPassesThroughOtherTypes) {
  ScriptedServer server({html_ok("{\"a\":1}", "application/json")});
  crow::response response =
      handle_proxy_request(ctx_, get_request(), token_for(server.url("/data")));
  ASSERT_EQ(response.code, 200);
  EXPECT_EQ(response.body, "{\"a\":1}");
  EXPECT_EQ(response.get_header_value("Content-Type"), "application/json");
}

TEST_F(RoutesTest, ProxyForwardsPost) {
  ScriptedServer server({html_ok("<p>ok</p>")});
  crow::request request;
  request.method = crow::HTTPMethod::Post;
  request.body = "q=1";
  request.add_header("Content-Type", "application/x-www-form-urlencoded");
  crow::response response =
      handle_proxy_request(ctx_, request, token_for(server.url("/form")));
  EXPECT_EQ(response.code, 200);
  auto requests = server.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].rfind("POST /form", 0), 0u);
}

TEST_F(RoutesTest, ProxyUpstreamErrorStatusIsBadGateway) {
  ScriptedServer server({"HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n"});
  crow::response response =
      handle_proxy_request(ctx_, get_request(), token_for(server.url("/missing")));
  EXPECT_EQ(response.code, 502);
  EXPECT_NE(response.body.find("HTTP 404"), std::string::npos);
}

TEST_F(RoutesTest, ProxyRefusedConnection) {
  const std::string url =
      "http://127.0.0.1:" + std::to_string(closed_loopback_port()) + "/";
  crow::response response = handle_proxy_request(ctx_, get_request(), token_for(url));
  EXPECT_EQ(response.code, 502);
  EXPECT_NE(response.body.find("Connection refused"), std::string::npos);
}

TEST_F(RoutesTest, ProxyTimeoutIsGatewayTimeout) {
  ctx_.proxy_timeout_ms = 300;
  ScriptedServer server({html_ok("late")}, 1500);
  crow::response response =
      handle_proxy_request(ctx_, get_request(), token_for(server.url()));
  EXPECT_EQ(response.code, 504);
  EXPECT_NE(response.body.find("Timeout"), std::string::npos);
}

TEST_F(RoutesTest, ImageIsCachedOrReplaced) {
  ScriptedServer server({html_ok("PNGDATA", "image/png"),
                         "HTTP/1.1 500 Oops\r\nContent-Length: 0\r\n\r\n"});
  crow::response ok = handle_image_request(ctx_, get_request(), token_for(server.url("/a.png")));
  EXPECT_EQ(ok.code, 200);
  EXPECT_EQ(ok.body, "PNGDATA");
  EXPECT_EQ(ok.get_header_value("Cache-Control"), "public, max-age=3600");

  crow::response failed =
      handle_image_request(ctx_, get_request(), token_for(server.url("/b.png")));
  EXPECT_EQ(failed.code, 200);
  EXPECT_EQ(failed.body, placeholder_png());

  auto requests = server.requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_NE(requests[0].find("Referer: " + server.url("") + "\r\n"), std::string::npos);
}

TEST_F(RoutesTest, AssetCssIsRewrittenAgainstItsOwnUrl) {
  ScriptedServer server({html_ok("body{background:url(../img/x.png)}", "text/css")});
  crow::response response =
      handle_asset_request(ctx_, get_request(), token_for(server.url("/css/site.css")));
  ASSERT_EQ(response.code, 200);
  EXPECT_EQ(response.get_header_value("Cache-Control"), "public, max-age=3600");
  const size_t start = response.body.find("/asset/");
  ASSERT_NE(start, std::string::npos);
  const size_t end = response.body.find('\'', start);
  auto target = ctx_.codec->decode(response.body.substr(start + 7, end - start - 7));
  EXPECT_EQ(target.value_or(""), server.url("/img/x.png"));
}

}  // namespace
