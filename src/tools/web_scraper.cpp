#include "toolgate/tools/web_scraper.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/util/json.hpp"
#include "toolgate/version.hpp"

#include <httplib.h>

#include <cctype>
#include <map>
#include <memory>
#include <sstream>
#include <utility>
#include <variant>

namespace toolgate::tools
{

namespace
{

constexpr auto npos = std::string::npos;

bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string to_lower(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

struct ParsedUrl
{
    std::string scheme;
    std::string host;
    int port{80};
    std::string target;
};

ParsedUrl parse_url(const std::string& url)
{
    const ValidationError usage("scrape_url requires a URL like http://host[:port][/path]");

    const auto separator = url.find("://");
    if (separator == npos)
        throw usage;

    ParsedUrl parsed;
    parsed.scheme = to_lower(url.substr(0, separator));
    if (parsed.scheme != "http" && parsed.scheme != "https")
        throw usage;

    const auto host_begin = separator + 3;
    auto rest = url.find_first_of("/:?#", host_begin);
    if (rest == npos)
        rest = url.size();
    parsed.host = url.substr(host_begin, rest - host_begin);
    if (parsed.host.empty())
        throw usage;

    parsed.port = parsed.scheme == "https" ? 443 : 80;
    if (rest < url.size() && url[rest] == ':')
    {
        auto port_end = url.find_first_of("/?#", rest + 1);
        if (port_end == npos)
            port_end = url.size();
        const auto port = url.substr(rest + 1, port_end - rest - 1);
        if (port.empty() || port.size() > 5 ||
            port.find_first_not_of("0123456789") != npos)
            throw usage;
        parsed.port = std::stoi(port);
        rest = port_end;
    }

    const auto fragment = url.find('#', rest);
    parsed.target = url.substr(rest, fragment == npos ? npos : fragment - rest);
    if (parsed.target.empty())
        parsed.target = "/";
    else if (parsed.target.front() == '?')
        parsed.target = "/" + parsed.target;
    return parsed;
}

std::string decode_entities(const std::string& s)
{
    static const std::pair<std::string, std::string> kEntities[] = {
        {"&nbsp;", " "}, {"&lt;", "<"},   {"&gt;", ">"},   {"&quot;", "\""},
        {"&#39;", "'"},  {"&apos;", "'"}, {"&amp;", "&"},
    };

    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size())
    {
        const auto amp = s.find('&', pos);
        if (amp == npos)
        {
            out.append(s, pos, npos);
            break;
        }
        out.append(s, pos, amp - pos);
        pos = amp + 1;
        bool decoded = false;
        for (const auto& [from, to] : kEntities)
        {
            if (s.compare(amp, from.size(), from) == 0)
            {
                out += to;
                pos = amp + from.size();
                decoded = true;
                break;
            }
        }
        if (!decoded)
            out += '&';
    }
    return out;
}

/// An opening or closing tag; name is lowercased, end is one past '>'
struct Tag
{
    std::string name;
    std::string text;
    size_t end{0};
    bool closing{false};
};

/// Reads the tag whose '<' is at html[pos]; false if none starts there
bool read_tag(const std::string& html, size_t pos, Tag& tag)
{
    size_t i = pos + 1;
    tag.closing = i < html.size() && html[i] == '/';
    if (tag.closing)
        ++i;
    const size_t name_begin = i;
    if (i >= html.size() || !std::isalpha(static_cast<unsigned char>(html[i])))
        return false;
    while (i < html.size() && std::isalnum(static_cast<unsigned char>(html[i])))
        ++i;
    if (i < html.size() && !is_space(html[i]) && html[i] != '>' && html[i] != '/')
        return false;
    const auto gt = html.find('>', i);
    if (gt == npos)
        return false;
    tag.name = to_lower(html.substr(name_begin, i - name_begin));
    tag.text = html.substr(pos, gt + 1 - pos);
    tag.end = gt + 1;
    return true;
}

/// Calls fn(tag) for every opening tag in document order
template <typename Fn>
void for_each_open_tag(const std::string& html, Fn&& fn)
{
    // Past the last '>' no tag can complete
    const auto last_gt = html.rfind('>');
    auto lt = html.find('<');
    while (lt != npos && last_gt != npos && lt < last_gt)
    {
        Tag tag;
        if (!read_tag(html, lt, tag))
        {
            lt = html.find('<', lt + 1);
            continue;
        }
        if (!tag.closing)
            fn(tag);
        lt = html.find('<', tag.end);
    }
}

/// Case-insensitive lookup of "</name>" over one document
class ClosingTags
{
  public:
    explicit ClosingTags(const std::string& html) : lower_(to_lower(html)) {}

    /// [begin, end) of the first "</name>" at or after from; begin is npos if there is none
    std::pair<size_t, size_t> find(const std::string& name, size_t from)
    {
        auto known = missing_after_.find(name);
        if (known != missing_after_.end() && from >= known->second)
            return {npos, npos};

        const std::string needle = "</" + name;
        for (auto pos = lower_.find(needle, from); pos != npos; pos = lower_.find(needle, pos + 1))
        {
            auto i = pos + needle.size();
            while (i < lower_.size() && is_space(lower_[i]))
                ++i;
            if (i < lower_.size() && lower_[i] == '>')
                return {pos, i + 1};
        }
        if (known == missing_after_.end() || from < known->second)
            missing_after_[name] = from;
        return {npos, npos};
    }

  private:
    std::string lower_;
    std::map<std::string, size_t> missing_after_;
};

bool is_raw_text(const std::string& name)
{
    return name == "script" || name == "style" || name == "noscript";
}

/// Drops comments and script/style/noscript bodies, turns every other tag into '\n'
std::string strip_tags(const std::string& html)
{
    ClosingTags closing(html);
    bool comments_terminate = true;
    std::string out;
    out.reserve(html.size());

    size_t pos = 0;
    while (pos < html.size())
    {
        const auto lt = html.find('<', pos);
        if (lt == npos)
        {
            out.append(html, pos, npos);
            break;
        }
        out.append(html, pos, lt - pos);

        if (comments_terminate && html.compare(lt, 4, "<!--") == 0)
        {
            const auto end = html.find("-->", lt + 4);
            if (end != npos)
            {
                out += ' ';
                pos = end + 3;
                continue;
            }
            comments_terminate = false;
        }

        Tag tag;
        if (read_tag(html, lt, tag) && !tag.closing && is_raw_text(tag.name))
        {
            const auto block = closing.find(tag.name, tag.end);
            if (block.first != npos)
            {
                out += ' ';
                pos = block.second;
                continue;
            }
        }

        const auto gt = html.find('>', lt + 1);
        if (gt == npos)
        {
            out.append(html, lt, npos);
            break;
        }
        if (gt == lt + 1)
        {
            out += '<';
            pos = lt + 1;
            continue;
        }
        out += '\n';
        pos = gt + 1;
    }
    return decode_entities(out);
}

/// Trim each line, drop empty ones, join with '\n'
std::string normalize_lines(const std::string& text)
{
    std::istringstream in(text);
    std::string line, out;
    while (std::getline(in, line))
    {
        const auto first = line.find_first_not_of(" \t\r\f\v");
        if (first == npos)
            continue;
        const auto last = line.find_last_not_of(" \t\r\f\v");
        if (!out.empty())
            out += '\n';
        out += line.substr(first, last - first + 1);
    }
    return out;
}

/// Text content collapsed to single spaces
std::string inline_text(const std::string& html)
{
    const auto text = strip_tags(html);
    std::string out;
    bool space = false;
    for (const char c : text)
    {
        if (is_space(c))
        {
            space = !out.empty();
            continue;
        }
        if (space)
            out += ' ';
        space = false;
        out += c;
    }
    return out;
}

/// Value of attribute name in an opening tag's text; empty if absent
std::string attribute(const std::string& tag, const std::string& name)
{
    const auto stop = [&](size_t i)
    { return i >= tag.size() || is_space(tag[i]) || tag[i] == '>' || tag[i] == '/'; };

    size_t i = 1;
    while (!stop(i))
        ++i;

    while (i < tag.size())
    {
        while (i < tag.size() && (is_space(tag[i]) || tag[i] == '/'))
            ++i;
        const size_t key_begin = i;
        while (!stop(i) && tag[i] != '=')
            ++i;
        if (i == key_begin)
            break;
        const auto key = to_lower(tag.substr(key_begin, i - key_begin));

        while (i < tag.size() && is_space(tag[i]))
            ++i;
        std::string value;
        if (i < tag.size() && tag[i] == '=')
        {
            ++i;
            while (i < tag.size() && is_space(tag[i]))
                ++i;
            if (i < tag.size() && (tag[i] == '"' || tag[i] == '\''))
            {
                auto close = tag.find(tag[i], i + 1);
                if (close == npos)
                    close = tag.size();
                value = tag.substr(i + 1, close - i - 1);
                i = close + 1;
            }
            else
            {
                const size_t value_begin = i;
                while (i < tag.size() && !is_space(tag[i]) && tag[i] != '>')
                    ++i;
                value = tag.substr(value_begin, i - value_begin);
            }
        }
        if (key == name)
            return decode_entities(value);
    }
    return std::string();
}

bool has_class(const std::string& classes, const std::string& wanted)
{
    std::istringstream in(classes);
    std::string cls;
    while (in >> cls)
        if (cls == wanted)
            return true;
    return false;
}

Json select_elements(const std::string& html, const std::string& selector)
{
    std::string tag_name; // empty matches any tag
    std::string attr_filter;
    std::string attr_name;

    const auto marker = selector.find_first_of("#.");
    if (marker == npos)
    {
        tag_name = to_lower(selector);
    }
    else
    {
        tag_name = to_lower(selector.substr(0, marker));
        attr_name = selector[marker] == '#' ? "id" : "class";
        attr_filter = selector.substr(marker + 1);
        if (attr_filter.empty())
            throw ValidationError("invalid selector: " + selector);
    }

    ClosingTags closing(html);
    Json out = Json::array();
    // Opening tags only, so a non-matching ancestor does not hide its descendants
    for_each_open_tag(html,
                      [&](const Tag& tag)
                      {
                          if (!tag_name.empty() && tag.name != tag_name)
                              return;
                          if (attr_name == "id" && attribute(tag.text, "id") != attr_filter)
                              return;
                          if (attr_name == "class" &&
                              !has_class(attribute(tag.text, "class"), attr_filter))
                              return;

                          // Content runs to the first closing tag of the same name
                          const auto close = closing.find(tag.name, tag.end);
                          if (close.first == npos)
                              return;
                          out.push_back(inline_text(html.substr(tag.end, close.first - tag.end)));
                      });
    return out;
}

} // namespace

Json extract_html(const std::string& html, const std::string& selector, bool extract_links)
{
    Json result = Json::object();
    result["title"] = nullptr;
    Json links = Json::array();
    Json meta = Json::object();
    bool titled = false;

    ClosingTags closing(html);
    for_each_open_tag(html,
                      [&](const Tag& tag)
                      {
                          if (tag.name == "title" && !titled)
                          {
                              const auto close = closing.find("title", tag.end);
                              if (close.first == npos)
                                  return;
                              result["title"] =
                                  inline_text(html.substr(tag.end, close.first - tag.end));
                              titled = true;
                          }
                          else if (tag.name == "meta")
                          {
                              auto key = attribute(tag.text, "name");
                              if (key.empty())
                                  key = attribute(tag.text, "property");
                              if (!key.empty())
                                  meta[key] = attribute(tag.text, "content");
                          }
                          else if (tag.name == "a" && extract_links)
                          {
                              const auto href = attribute(tag.text, "href");
                              if (href.empty())
                                  return;
                              const auto close = closing.find("a", tag.end);
                              if (close.first == npos)
                                  return;
                              links.push_back(Json{
                                  {"text", inline_text(html.substr(tag.end, close.first - tag.end))},
                                  {"href", href}});
                          }
                      });

    if (!selector.empty())
    {
        auto selected = select_elements(html, selector);
        result["selected_count"] = selected.size();
        result["selected_content"] = std::move(selected);
    }
    else
    {
        result["text"] = normalize_lines(strip_tags(html));
    }

    if (extract_links)
    {
        result["link_count"] = links.size();
        result["links"] = std::move(links);
    }
    result["metadata"] = meta;

    return result;
}

namespace
{

struct Fetched
{
    int status{0};
    std::string body;
};

/// GET url; a returned Json is a {"success": false} failure
std::variant<Fetched, Json> http_get(const std::string& url, const httplib::Headers& extra)
{
    ParsedUrl parsed;
    try
    {
        parsed = parse_url(url);
    }
    catch (const ValidationError& e)
    {
        return Json{{"success", false}, {"error", e.what()}};
    }

    std::unique_ptr<httplib::Client> client;
    if (parsed.scheme == "http")
    {
        client = std::make_unique<httplib::Client>(parsed.host, parsed.port);
    }
    else
    {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client = std::make_unique<httplib::SSLClient>(parsed.host, parsed.port);
#else
        return Json{{"success", false},
                    {"error", "https:// requires CPPHTTPLIB_OPENSSL_SUPPORT at build time"}};
#endif
    }
    client->set_follow_location(true);
    client->set_connection_timeout(30, 0);
    client->set_read_timeout(30, 0);

    httplib::Headers headers = {
        {"User-Agent", std::string("toolgate/") + VERSION_STRING + " (scrape_url)"}};
    for (const auto& [key, value] : extra)
    {
        headers.erase(key);
        headers.emplace(key, value);
    }

    auto response = client->Get(parsed.target.c_str(), headers);
    if (!response)
        return Json{{"success", false},
                    {"error", "Request error: " + httplib::to_string(response.error())}};

    if (response->status >= 400)
        return Json{{"success", false},
                    {"error", "HTTP error " + std::to_string(response->status) + ": " +
                                  response->body.substr(0, 200)}};

    return Fetched{response->status, response->body};
}

} // namespace

Json scrape_url(const std::string& url, const std::string& selector, bool extract_links)
{
    auto fetched = http_get(url, {});
    if (auto* failure = std::get_if<Json>(&fetched))
        return *failure;
    const auto& page = std::get<Fetched>(fetched);

    Json result;
    try
    {
        result = extract_html(page.body, selector, extract_links);
    }
    catch (const ValidationError& e)
    {
        return Json{{"success", false}, {"error", e.what()}};
    }
    result["success"] = true;
    result["url"] = url;
    result["status_code"] = page.status;
    return result;
}

Json fetch_json(const std::string& url, const Json& headers)
{
    httplib::Headers extra;
    if (headers.is_object())
        for (auto it = headers.begin(); it != headers.end(); ++it)
            extra.emplace(it.key(), it->is_string() ? it->get<std::string>() : it->dump());
    if (extra.find("Accept") == extra.end())
        extra.emplace("Accept", "application/json");

    auto fetched = http_get(url, extra);
    if (auto* failure = std::get_if<Json>(&fetched))
        return *failure;
    const auto& page = std::get<Fetched>(fetched);

    Json data = Json::parse(page.body, nullptr, false);
    if (data.is_discarded())
        return Json{{"success", false}, {"error", "Invalid JSON in response from " + url}};

    return Json{{"success", true}, {"url", url}, {"status_code", page.status}, {"data", data}};
}

Tool make_web_scraper_tool()
{
    Json schema = {{"type", "object"},
                   {"properties", Json{{"url", Json{{"type", "string"}}},
                                       {"selector", Json{{"type", "string"}}},
                                       {"extract_links", Json{{"type", "boolean"}, {"default", false}}}}},
                   {"required", Json::array({"url"})}};

    return Tool("scrape_url", "Scrape content from a URL", schema,
                [](const Json& args)
                {
                    if (!args.contains("url") || !args["url"].is_string())
                        throw ValidationError("argument 'url' must be a string");
                    return scrape_url(args["url"].get<std::string>(),
                                      util::json::value_or<std::string>(args, "selector", ""),
                                      util::json::value_or<bool>(args, "extract_links", false));
                });
}

Tool make_fetch_json_tool()
{
    Json schema = {{"type", "object"},
                   {"properties", Json{{"url", Json{{"type", "string"}}},
                                       {"headers", Json{{"type", "object"}}}}},
                   {"required", Json::array({"url"})}};

    return Tool("fetch_json", "Fetch JSON data from a URL", schema,
                [](const Json& args)
                {
                    if (!args.contains("url") || !args["url"].is_string())
                        throw ValidationError("argument 'url' must be a string");
                    return fetch_json(args["url"].get<std::string>(),
                                      args.contains("headers") ? args["headers"] : Json::object());
                });
}

} // namespace toolgate::tools
