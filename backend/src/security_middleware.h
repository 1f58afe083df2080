#pragma once
// ─── VeilProxy — Security headers middleware ────────────────────────────
// Global Crow middleware that adds security and CORS headers to every
// response.  Route files use CrowApp (= crow::App<SecurityHeadersMiddleware>)
// instead of crow::SimpleApp.

#include "crow.h"

#include <string>

struct SecurityHeadersMiddleware {
  struct context {
    std::string origin;
  };

  void before_handle(crow::request &req, crow::response & /*res*/,
                     context &ctx) {
    ctx.origin = req.get_header_value("Origin");
  }

  void after_handle(crow::request & /*req*/, crow::response &res,
                    context &ctx) {
    res.set_header("X-Content-Type-Options", "nosniff");
    res.set_header("X-XSS-Protection", "1; mode=block");
    res.set_header("Referrer-Policy", "strict-origin-when-cross-origin");

    // Proxied pages run scripts from many origins; no CSP is added here.
    if (!ctx.origin.empty()) {
      res.set_header("Access-Control-Allow-Origin", ctx.origin);
      res.set_header("Access-Control-Allow-Credentials", "true");
      res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
      res.set_header("Access-Control-Allow-Headers", "Content-Type");
      res.add_header("Vary", "Origin");
    }
  }
};

// Every route file should use this alias instead of crow::SimpleApp.
using CrowApp = crow::App<SecurityHeadersMiddleware>;
