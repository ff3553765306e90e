#include "toolgate/tools/file_operations.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace toolgate;
using namespace toolgate::tools;
namespace fs = std::filesystem;

namespace
{
struct TempDir
{
    fs::path path;

    TempDir()
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("toolgate_files_" + std::to_string(stamp));
        fs::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void put(const fs::path& p, const std::string& content)
{
    fs::create_directories(p.parent_path());
    std::ofstream(p) << content;
}
} // namespace

int main()
{
    std::cout << "Running file operation tests...\n";
    TempDir tmp;
    FileAccessPolicy policy;

    // glob_match
    {
        assert(glob_match("*.txt", "notes.txt"));
        assert(!glob_match("*.txt", "notes.md"));
        assert(glob_match("n?tes.*", "notes.md"));
        assert(glob_match("*", ""));
        assert(!glob_match("a*b", "acd"));
        std::cout << "  [PASS] glob_match\n";
    }

    // write then read
    {
        const auto file = (tmp.path / "sub" / "hello.txt").string();
        auto w = write_file(file, "hello world", true, policy);
        assert(w["success"] == true);
        assert(w["size"] == 11);

        auto r = read_file(file, policy);
        assert(r["success"] == true);
        assert(r["content"] == "hello world");
        assert(r["parsed_content"].is_null());
        std::cout << "  [PASS] write then read\n";
    }

    // JSON files are parsed
    {
        const auto file = tmp.path / "data.json";
        put(file, R"({"a": [1, 2]})");
        auto r = read_file(file.string(), policy);
        assert(r["success"] == true);
        assert(r["parsed_content"]["a"][1] == 2);

        put(tmp.path / "broken.json", "{not json");
        r = read_file((tmp.path / "broken.json").string(), policy);
        assert(r["success"] == true);
        assert(r["parsed_content"].is_null());
        std::cout << "  [PASS] JSON parsing\n";
    }

    // Policy rejections
    {
        put(tmp.path / "binary.exe", "MZ");
        auto r = read_file((tmp.path / "binary.exe").string(), policy);
        assert(r["success"] == false);
        assert(r["allowed_extensions"].size() == 4);

        r = write_file((tmp.path / "out.sh").string(), "echo", true, policy);
        assert(r["success"] == false);
        assert(!fs::exists(tmp.path / "out.sh"));

        FileAccessPolicy tiny;
        tiny.max_file_size_bytes = 4;
        put(tmp.path / "big.txt", "0123456789");
        r = read_file((tmp.path / "big.txt").string(), tiny);
        assert(r["success"] == false);
        assert(r["error"].get<std::string>().find("too large") != std::string::npos);
        r = write_file((tmp.path / "big2.txt").string(), "0123456789", true, tiny);
        assert(r["success"] == false);

        FileAccessPolicy any;
        any.allowed_extensions.clear();
        assert(read_file((tmp.path / "binary.exe").string(), any)["success"] == true);
        std::cout << "  [PASS] policy rejections\n";
    }

    // Missing paths
    {
        auto r = read_file((tmp.path / "missing.txt").string(), policy);
        assert(r["success"] == false);
        assert(r["error"].get<std::string>().find("File not found") != std::string::npos);

        assert(read_file(tmp.path.string(), policy)["success"] == false);

        r = write_file((tmp.path / "nodir" / "x.txt").string(), "x", false, policy);
        assert(r["success"] == false);
        assert(!fs::exists(tmp.path / "nodir"));

        assert(list_directory((tmp.path / "nope").string(), "", false)["success"] == false);
        std::cout << "  [PASS] missing paths\n";
    }

    // list_directory
    {
        const auto root = tmp.path / "tree";
        put(root / "a.txt", "a");
        put(root / "b.md", "b");
        put(root / "nested" / "c.txt", "c");

        auto flat = list_directory(root.string(), "", false);
        assert(flat["success"] == true);
        assert(flat["count"] == 3);
        assert(flat["files"][0]["name"] == "a.txt");
        assert(flat["files"][0]["is_file"] == true && flat["files"][0]["size"] == 1);
        assert(flat["files"][2]["name"] == "nested" && flat["files"][2]["is_dir"] == true);

        auto txt = list_directory(root.string(), "*.txt", false);
        assert(txt["count"] == 1);

        auto deep = list_directory(root.string(), "*.txt", true);
        assert(deep["count"] == 2);
        std::cout << "  [PASS] list_directory\n";
    }

    // Tool adapters
    {
        auto tool = make_write_file_tool(policy);
        const auto file = (tmp.path / "tool" / "t.md").string();
        auto w = tool.invoke(Json{{"path", file}, {"content", "# hi"}});
        assert(w["success"] == true);
        auto r = make_read_file_tool(policy).invoke(Json{{"path", file}});
        assert(r["content"] == "# hi");
        auto l = make_list_directory_tool().invoke(Json{{"path", (tmp.path / "tool").string()}});
        assert(l["count"] == 1);
        std::cout << "  [PASS] tool adapters\n";
    }

    std::cout << "All file operation tests passed\n";
    return 0;
}
