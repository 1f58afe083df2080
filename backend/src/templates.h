#pragma once
// ─── VeilProxy — Static page templates ──────────────────────────────────
// Landing page, error pages, the control overlay injected into proxied
// documents, and the image placeholder.

#include <string>

const std::string &landing_page_html();

// Style + behaviour script, inserted before </head>.
const std::string &overlay_head_markup();
// Overlay controls (search, refresh, fullscreen, user count), inserted
// right after <body>.
const std::string &overlay_body_markup();

// Page shown when a fetch through /proxy fails.  `headline` and `detail`
// are escaped.
std::string error_page_html(const std::string &headline,
                            const std::string &detail);

// Fixed 1x1 transparent PNG.
const std::string &placeholder_png();
