#pragma once
// ─── VeilProxy — Page, API and presence route registration ──────────────
// Each register_* function adds a group of CROW_ROUTE entries.  The JSON
// handlers are exposed on their own so they can be driven without a
// running server.

#include "security_middleware.h"

struct AppContext;

// POST /api/encrypt-url: {"url": ...} -> {"encrypted": token}
crow::response handle_encrypt_url(AppContext &ctx, const crow::request &request);

// POST /api/search: {"query": ...} -> {"url": "/proxy/" + token}
crow::response handle_search(AppContext &ctx, const crow::request &request);

crow::response handle_health(AppContext &ctx);

// Listener address, port, worker count and response compression.
void configure_server(CrowApp &app, const AppContext &ctx);

void register_page_routes(CrowApp &app, AppContext &ctx);
void register_api_routes(CrowApp &app, AppContext &ctx);

// WebSocket /ws.  Every open connection counts as one present visitor and
// receives {"type":"userCount","count":N} whenever the count changes.
void register_presence_routes(CrowApp &app, AppContext &ctx);
