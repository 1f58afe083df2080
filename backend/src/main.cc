// ─── VeilProxy — Server entry point ─────────────────────────────────────

#include "app_context.h"
#include "crypto.h"
#include "http_proxy.h"
#include "routes.h"
#include "security_middleware.h"
#include "version.h"

#include <csignal>
#include <iostream>

int main() {
  // Upstream peers may close mid-write; report that as an error, not a signal.
  std::signal(SIGPIPE, SIG_IGN);

  AppContext ctx;
  ctx.load_config_from_env();

  try {
    ctx.init_codec();
  } catch (const crypto::CodecError &e) {
    std::cerr << "VeilProxy: cannot initialise the URL codec: " << e.what()
              << std::endl;
    return 1;
  }

  CrowApp app;
  register_page_routes(app, ctx);
  register_api_routes(app, ctx);
  register_presence_routes(app, ctx);
  register_proxy_routes(app, ctx);

  CROW_LOG_INFO << "VeilProxy " << APP_VERSION << " listening on "
                << ctx.bind_address << ":" << ctx.port;

  configure_server(app, ctx);
  app.run();
  return 0;
}
