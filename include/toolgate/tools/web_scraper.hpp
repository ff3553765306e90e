#pragma once
#include "toolgate/tools/tool.hpp"

#include <string>

namespace toolgate::tools
{

/// Extract title, text, meta tags and optionally links and selected elements from HTML.
/// selector supports "tag", "#id", ".class" and "tag.class".
Json extract_html(const std::string& html, const std::string& selector = "",
                  bool extract_links = false);

/// Fetch url with an HTTP GET and run extract_html over the body.
/// Transport failures and HTTP errors are returned as {"success": false, "error"}.
Json scrape_url(const std::string& url, const std::string& selector = "",
                bool extract_links = false);

/// GET url and parse the body as JSON: {"success", "url", "status_code", "data"}.
/// headers are added to the request (string values; others are sent dumped).
Json fetch_json(const std::string& url, const Json& headers = Json::object());

/// "scrape_url" tool: arguments {url, selector, extract_links}
Tool make_web_scraper_tool();

/// "fetch_json" tool: arguments {url, headers}
Tool make_fetch_json_tool();

} // namespace toolgate::tools
