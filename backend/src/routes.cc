// ─── VeilProxy — Page, API and presence routes ──────────────────────────

#include "routes.h"
#include "app_context.h"
#include "crypto.h"
#include "search.h"
#include "templates.h"
#include "url.h"
#include "utils.h"
#include "version.h"

#include <vector>

namespace {

crow::response json_response(int code, const crow::json::wvalue &payload) {
  crow::response resp(code, payload.dump());
  resp.set_header("Content-Type", "application/json");
  return resp;
}

crow::response json_error(int code, const std::string &message) {
  crow::json::wvalue payload;
  payload["error"] = message;
  return json_response(code, payload);
}

std::string user_count_message(size_t count) {
  crow::json::wvalue payload;
  payload["type"] = "userCount";
  payload["count"] = static_cast<uint64_t>(count);
  return payload.dump();
}

}  // namespace

// ══════════════════════════════════════════════════════════════════════
//  Handlers
// ══════════════════════════════════════════════════════════════════════

crow::response handle_encrypt_url(AppContext &ctx, const crow::request &request) {
  auto body = crow::json::load(request.body);
  if (!body) return json_error(400, "Invalid JSON body");
  if (body.t() != crow::json::type::Object || !body.has("url") ||
      body["url"].t() != crow::json::type::String) {
    return json_error(400, "Invalid URL");
  }

  std::string url = body["url"].s();
  if (!is_valid_http_url(url)) return json_error(400, "Invalid URL");

  std::string token;
  try {
    token = ctx.codec->encode(url);
  } catch (const crypto::CodecError &e) {
    CROW_LOG_ERROR << "Encrypt: " << e.what();
    return json_error(500, "Failed to encrypt URL");
  }

  crow::json::wvalue payload;
  payload["encrypted"] = token;
  return json_response(200, payload);
}

crow::response handle_search(AppContext &ctx, const crow::request &request) {
  auto body = crow::json::load(request.body);
  if (!body || body.t() != crow::json::type::Object || !body.has("query") ||
      body["query"].t() != crow::json::type::String) {
    return json_error(400, "Query required");
  }

  std::string query = body["query"].s();
  if (trim_copy(query).empty()) return json_error(400, "Query cannot be empty");

  SearchResolution resolution = resolve_search_query(query, ctx.search_base_url);
  if (!is_valid_http_url(resolution.url)) {
    CROW_LOG_INFO << "Search: rejected \"" << query << "\"";
    return json_error(400, "Invalid URL");
  }

  std::string token;
  try {
    token = ctx.codec->encode(resolution.url);
  } catch (const crypto::CodecError &e) {
    CROW_LOG_ERROR << "Search: " << e.what();
    return json_error(500, "Failed to encrypt URL");
  }

  CROW_LOG_DEBUG << "Search: \"" << query << "\" -> " << resolution.url;
  crow::json::wvalue payload;
  payload["url"] = "/proxy/" + token;
  return json_response(200, payload);
}

crow::response handle_health(AppContext &ctx) {
  crow::json::wvalue payload;
  payload["status"] = "ok";
  payload["users"] = static_cast<uint64_t>(ctx.presence.count());
  payload["uptime"] = ctx.uptime_seconds();
  payload["version"] = APP_VERSION;
  return json_response(200, payload);
}

// ══════════════════════════════════════════════════════════════════════
//  Server options
// ══════════════════════════════════════════════════════════════════════

void configure_server(CrowApp &app, const AppContext &ctx) {
  app.bindaddr(ctx.bind_address).port(static_cast<uint16_t>(ctx.port));
  if (ctx.threads > 0) {
    app.concurrency(static_cast<uint16_t>(ctx.threads));
  } else {
    app.multithreaded();
  }
  if (ctx.compression) {
    app.use_compression(crow::compression::algorithm::GZIP);
  }
}

// ══════════════════════════════════════════════════════════════════════
//  Pages
// ══════════════════════════════════════════════════════════════════════

void register_page_routes(CrowApp &app, AppContext &) {
  CROW_ROUTE(app, "/")([] {
    crow::response resp(200, landing_page_html());
    resp.set_header("Content-Type", "text/html; charset=utf-8");
    return resp;
  });
}

// ══════════════════════════════════════════════════════════════════════
//  JSON API
// ══════════════════════════════════════════════════════════════════════

void register_api_routes(CrowApp &app, AppContext &ctx) {
  CROW_ROUTE(app, "/api/health")([&ctx] { return handle_health(ctx); });

  CROW_ROUTE(app, "/api/user-count")([&ctx] {
    crow::json::wvalue payload;
    payload["count"] = static_cast<uint64_t>(ctx.presence.count());
    return json_response(200, payload);
  });

  CROW_ROUTE(app, "/api/encrypt-url").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        return handle_encrypt_url(ctx, request);
      });

  CROW_ROUTE(app, "/api/search").methods(crow::HTTPMethod::Post)(
      [&ctx](const crow::request &request) {
        return handle_search(ctx, request);
      });
}

// ══════════════════════════════════════════════════════════════════════
//  Presence
// ══════════════════════════════════════════════════════════════════════

void register_presence_routes(CrowApp &app, AppContext &ctx) {
  ctx.presence.subscribe([&ctx](size_t count) {
    const std::string message = user_count_message(count);
    std::lock_guard<std::mutex> lock(ctx.ws_mutex);
    for (auto &entry : ctx.ws_clients) entry.first->send_text(message);
  });

  CROW_WEBSOCKET_ROUTE(app, "/ws")
      .onopen([&ctx](crow::websocket::connection &conn) {
        std::string member_id;
        try {
          member_id = crypto::random_hex(8);
        } catch (const crypto::CodecError &e) {
          CROW_LOG_ERROR << "Presence: " << e.what();
          conn.close("internal error");
          return;
        }
        {
          std::lock_guard<std::mutex> lock(ctx.ws_mutex);
          ctx.ws_clients[&conn] = member_id;
        }
        size_t count = ctx.presence.join(member_id);
        CROW_LOG_DEBUG << "Presence: " << member_id << " joined (" << count
                       << " online)";
      })
      .onclose([&ctx](crow::websocket::connection &conn, const std::string &) {
        std::string member_id;
        {
          std::lock_guard<std::mutex> lock(ctx.ws_mutex);
          auto it = ctx.ws_clients.find(&conn);
          if (it == ctx.ws_clients.end()) return;
          member_id = it->second;
          ctx.ws_clients.erase(it);
        }
        size_t count = ctx.presence.leave(member_id);
        CROW_LOG_DEBUG << "Presence: " << member_id << " left (" << count
                       << " online)";
      })
      .onmessage([](crow::websocket::connection &, const std::string &, bool) {});
}
