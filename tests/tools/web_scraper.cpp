#include "toolgate/tools/web_scraper.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace toolgate;
using namespace toolgate::tools;

static const char* kPage = R"(<!DOCTYPE html>
<html>
<head>
  <title>  Sample &amp; Page </title>
  <meta name="description" content="A test page">
  <meta property="og:title" content="Sample">
  <style>body { color: red; }</style>
  <script>var hidden = 1;</script>
</head>
<body>
  <div class="content main">
    <h1>Heading</h1>
    <p>First paragraph</p>
    <p class="note">Second <b>bold</b> paragraph</p>
  </div>
  <!-- a comment -->
  <div id="footer">Footer &lt;text&gt;</div>
  <a href="/about">About us</a>
  <a href='https://example.com/x'>External</a>
  <a name="anchor">No href</a>
</body>
</html>)";

int main()
{
    std::cout << "Running web scraper tests...\n";

    // Title, text and metadata
    {
        auto r = extract_html(kPage);
        assert(r["title"] == "Sample & Page");
        const auto text = r["text"].get<std::string>();
        assert(text.find("Heading") != std::string::npos);
        assert(text.find("First paragraph") != std::string::npos);
        assert(text.find("Footer <text>") != std::string::npos);
        assert(text.find("hidden") == std::string::npos);
        assert(text.find("color") == std::string::npos);
        assert(text.find("comment") == std::string::npos);
        assert(r["metadata"]["description"] == "A test page");
        assert(r["metadata"]["og:title"] == "Sample");
        assert(!r.contains("links"));
        assert(!r.contains("selected_content"));
        std::cout << "  [PASS] title, text and metadata\n";
    }

    // Selectors
    {
        auto r = extract_html(kPage, "p");
        assert(!r.contains("text"));
        assert(r["selected_count"] == 2);
        assert(r["selected_content"][0] == "First paragraph");
        assert(r["selected_content"][1] == "Second bold paragraph");

        r = extract_html(kPage, "#footer");
        assert(r["selected_count"] == 1);
        assert(r["selected_content"][0] == "Footer <text>");

        r = extract_html(kPage, ".note");
        assert(r["selected_count"] == 1);

        r = extract_html(kPage, "div.main");
        assert(r["selected_count"] == 1);

        r = extract_html(kPage, "span");
        assert(r["selected_count"] == 0);
        std::cout << "  [PASS] selectors\n";
    }

    // Links
    {
        auto r = extract_html(kPage, "", true);
        assert(r["link_count"] == 2);
        assert(r["links"][0]["text"] == "About us");
        assert(r["links"][0]["href"] == "/about");
        assert(r["links"][1]["href"] == "https://example.com/x");
        std::cout << "  [PASS] links\n";
    }

    // Documents without a title
    {
        auto r = extract_html("<p>plain</p>");
        assert(r["title"].is_null());
        assert(r["text"] == "plain");
        assert(r["metadata"].empty());
        std::cout << "  [PASS] untitled document\n";
    }

    // Large inline scripts and comments
    {
        std::string script_body;
        while (script_body.size() < 300000)
            script_body += "if (a < b && c > d) { render('<div>x</div>'); }\n";
        const std::string comment_body(300000, '-');
        const std::string page = "<html><head><title>Big</title><SCRIPT type=\"text/javascript\">" +
                                 script_body + "</script >" + "</head><body><!--" + comment_body +
                                 "--><p class=\"lead\">Visible</p><a href=\"/next\">Next</a>" +
                                 "</body></html>";

        auto r = extract_html(page, "", true);
        assert(r["title"] == "Big");
        assert(r["text"] == "Big\nVisible\nNext");
        assert(r["link_count"] == 1);
        assert(r["links"][0]["href"] == "/next");

        r = extract_html(page, "p.lead");
        assert(r["selected_count"] == 1);
        assert(r["selected_content"][0] == "Visible");

        // Unterminated constructs keep their text instead of swallowing the page
        r = extract_html(std::string(200000, '<') + "<p>tail</p>");
        assert(r["text"].get<std::string>().find("tail") != std::string::npos);
        r = extract_html("<p>head</p><script>" + std::string(200000, 'x'));
        assert(r["text"].get<std::string>().find("head") == 0);
        std::cout << "  [PASS] large documents\n";
    }

    // Malformed URLs fail without a request
    {
        auto r = scrape_url("ftp://example.com/file");
        assert(r["success"] == false);
        r = fetch_json("not a url");
        assert(r["success"] == false);
        std::cout << "  [PASS] malformed URLs\n";
    }

    std::cout << "All web scraper tests passed\n";
    return 0;
}
