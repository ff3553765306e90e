#include "toolgate/tools/file_operations.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/util/json.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace toolgate::tools
{

namespace
{
Json failure(const std::string& message)
{
    return Json{{"success", false}, {"error", message}};
}

bool extension_allowed(const fs::path& p, const FileAccessPolicy& policy)
{
    if (policy.allowed_extensions.empty())
        return true;
    const auto ext = p.extension().string();
    return std::find(policy.allowed_extensions.begin(), policy.allowed_extensions.end(), ext) !=
           policy.allowed_extensions.end();
}

Json extension_rejected(const fs::path& p, const FileAccessPolicy& policy)
{
    auto out = failure("File type not allowed: " + p.extension().string());
    out["allowed_extensions"] = policy.allowed_extensions;
    return out;
}

std::string string_arg(const Json& args, const char* key)
{
    if (!args.contains(key) || !args[key].is_string())
        throw ValidationError(std::string("argument '") + key + "' must be a string");
    return args[key].get<std::string>();
}

Json entry_json(const fs::directory_entry& entry)
{
    std::error_code ec;
    Json info = {{"name", entry.path().filename().string()}, {"path", entry.path().string()}};
    const bool is_file = entry.is_regular_file(ec);
    info["is_file"] = is_file;
    info["is_dir"] = !is_file && entry.is_directory(ec);
    if (is_file)
        info["size"] = entry.file_size(ec);
    return info;
}
} // namespace

bool glob_match(const std::string& pattern, const std::string& name)
{
    size_t p = 0, n = 0;
    size_t star = std::string::npos, mark = 0;
    while (n < name.size())
    {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n]))
        {
            ++p;
            ++n;
        }
        else if (p < pattern.size() && pattern[p] == '*')
        {
            star = p++;
            mark = n;
        }
        else if (star != std::string::npos)
        {
            p = star + 1;
            n = ++mark;
        }
        else
        {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

Json read_file(const std::string& path, const FileAccessPolicy& policy)
{
    std::error_code ec;
    const fs::path file_path = fs::weakly_canonical(fs::path(path), ec);
    if (ec || !fs::exists(file_path, ec))
        return failure("File not found: " + path);
    if (!fs::is_regular_file(file_path, ec))
        return failure("Path is not a file: " + path);

    const auto size = fs::file_size(file_path, ec);
    if (ec)
        return failure("Cannot stat file: " + path);
    if (size > policy.max_file_size_bytes)
        return failure("File too large (max " +
                       std::to_string(policy.max_file_size_bytes / (1024 * 1024)) + "MB)");
    if (!extension_allowed(file_path, policy))
        return extension_rejected(file_path, policy);

    std::ifstream in(file_path, std::ios::binary);
    if (!in)
        return failure("Cannot open file: " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string content = buffer.str();

    Json parsed;
    if (file_path.extension() == ".json")
        parsed = Json::parse(content, nullptr, false);
    if (parsed.is_discarded())
        parsed = Json();

    return Json{{"success", true},
                {"path", file_path.string()},
                {"size", size},
                {"content", content},
                {"parsed_content", parsed},
                {"encoding", "utf-8"}};
}

Json write_file(const std::string& path, const std::string& content, bool create_dirs,
                const FileAccessPolicy& policy)
{
    std::error_code ec;
    const fs::path file_path = fs::weakly_canonical(fs::path(path), ec);
    if (ec)
        return failure("Invalid path: " + path);
    if (!extension_allowed(file_path, policy))
        return extension_rejected(file_path, policy);
    if (content.size() > policy.max_file_size_bytes)
        return failure("Content too large (max " +
                       std::to_string(policy.max_file_size_bytes / (1024 * 1024)) + "MB)");

    const auto parent = file_path.parent_path();
    if (!parent.empty() && !fs::exists(parent, ec))
    {
        if (!create_dirs)
            return failure("Parent directory does not exist: " + parent.string());
        fs::create_directories(parent, ec);
        if (ec)
            return failure("Cannot create directory " + parent.string() + ": " + ec.message());
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out)
        return failure("Cannot open file for writing: " + path);
    out << content;
    out.close();
    if (!out)
        return failure("Write failed: " + path);

    return Json{{"success", true},
                {"path", file_path.string()},
                {"size", content.size()},
                {"encoding", "utf-8"}};
}

Json list_directory(const std::string& path, const std::string& pattern, bool recursive)
{
    std::error_code ec;
    const fs::path dir_path = fs::weakly_canonical(fs::path(path), ec);
    if (ec || !fs::exists(dir_path, ec))
        return failure("Directory not found: " + path);
    if (!fs::is_directory(dir_path, ec))
        return failure("Path is not a directory: " + path);

    Json files = Json::array();
    auto consider = [&](const fs::directory_entry& entry)
    {
        if (!pattern.empty() && !glob_match(pattern, entry.path().filename().string()))
            return;
        files.push_back(entry_json(entry));
    };

    if (recursive)
    {
        fs::recursive_directory_iterator it(dir_path, fs::directory_options::skip_permission_denied,
                                            ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            consider(*it);
    }
    else
    {
        fs::directory_iterator it(dir_path, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec))
            consider(*it);
    }
    if (ec)
        return failure("Cannot list directory " + path + ": " + ec.message());

    // Directory iteration order is unspecified
    std::sort(files.begin(), files.end(), [](const Json& a, const Json& b)
              { return a["path"].get<std::string>() < b["path"].get<std::string>(); });

    return Json{{"success", true},
                {"path", dir_path.string()},
                {"count", files.size()},
                {"files", files}};
}

Tool make_read_file_tool(FileAccessPolicy policy)
{
    Json schema = {{"type", "object"},
                   {"properties", Json{{"path", Json{{"type", "string"}}}}},
                   {"required", Json::array({"path"})}};
    return Tool("read_file", "Read contents of a file", schema,
                [policy](const Json& args) { return read_file(string_arg(args, "path"), policy); });
}

Tool make_write_file_tool(FileAccessPolicy policy)
{
    Json schema = {{"type", "object"},
                   {"properties", Json{{"path", Json{{"type", "string"}}},
                                       {"content", Json{{"type", "string"}}},
                                       {"create_dirs", Json{{"type", "boolean"}, {"default", true}}}}},
                   {"required", Json::array({"path", "content"})}};
    return Tool("write_file", "Write content to a file", schema,
                [policy](const Json& args)
                {
                    return write_file(string_arg(args, "path"), string_arg(args, "content"),
                                      util::json::value_or<bool>(args, "create_dirs", true),
                                      policy);
                });
}

Tool make_list_directory_tool()
{
    Json schema = {{"type", "object"},
                   {"properties", Json{{"path", Json{{"type", "string"}}},
                                       {"pattern", Json{{"type", "string"}}},
                                       {"recursive", Json{{"type", "boolean"}, {"default", false}}}}},
                   {"required", Json::array({"path"})}};
    return Tool("list_directory", "List contents of a directory", schema,
                [](const Json& args)
                {
                    return list_directory(string_arg(args, "path"),
                                          util::json::value_or<std::string>(args, "pattern", ""),
                                          util::json::value_or<bool>(args, "recursive", false));
                });
}

} // namespace toolgate::tools
