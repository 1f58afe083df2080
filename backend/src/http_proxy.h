#pragma once
// ─── VeilProxy — Upstream client and token routes ───────────────────────
// Contains the raw HTTP/HTTPS client (http_proxy_request / fetch_url) and
// the Crow handlers behind /proxy/<token>, /image/<token> and
// /asset/<token>.

#include "crow.h"
#include "models.h"
#include "security_middleware.h"
#include "url.h"

#include <optional>
#include <string>

// Forward declaration
struct AppContext;

// One HTTP exchange with no redirect handling: connects (TLS for https),
// sends the request, reads the whole response before `deadline_ms` runs
// out.  Never throws; failures come back in `result.error`.
FetchResult http_proxy_request(const FetchRequest &request, const Url &target,
                               int deadline_ms);

// Full fetch: follows up to `request.max_redirects` redirects, all within
// `request.timeout_ms`.
FetchResult fetch_url(const FetchRequest &request);

// Splits a raw HTTP/1.x response into status, headers and (de-chunked)
// body.  Returns false and sets `error` when the response is malformed.
bool parse_http_response(const std::string &raw, UpstreamResponse &response,
                         std::string &error);

// Decodes a chunked transfer-coded body; std::nullopt when truncated or
// malformed.
std::optional<std::string> dechunk_body(const std::string &body);

// User-facing headline for a failed fetch ("Timeout", "Site not found"...).
std::string describe_fetch_error(FetchError error);

crow::response handle_proxy_request(AppContext &ctx,
                                    const crow::request &request,
                                    const std::string &token);
crow::response handle_image_request(AppContext &ctx,
                                    const crow::request &request,
                                    const std::string &token);
crow::response handle_asset_request(AppContext &ctx,
                                    const crow::request &request,
                                    const std::string &token);

// Registers /proxy/<string>, /image/<string> and /asset/<string>.
void register_proxy_routes(CrowApp &app, AppContext &ctx);
