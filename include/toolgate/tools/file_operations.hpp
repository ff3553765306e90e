#pragma once
#include "toolgate/tools/tool.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace toolgate::tools
{

/// Limits applied to every file tool call
struct FileAccessPolicy
{
    std::uintmax_t max_file_size_bytes{10 * 1024 * 1024};
    std::vector<std::string> allowed_extensions{".txt", ".json", ".md", ".py"}; ///< Empty = any
};

/// Read a text file; ".json" files are also returned parsed as "parsed_content"
Json read_file(const std::string& path, const FileAccessPolicy& policy);

Json write_file(const std::string& path, const std::string& content, bool create_dirs,
                const FileAccessPolicy& policy);

/// List a directory, optionally filtered by a glob on the entry name ('*' and '?')
Json list_directory(const std::string& path, const std::string& pattern, bool recursive);

/// Shell-style match of name against pattern supporting '*' and '?'
bool glob_match(const std::string& pattern, const std::string& name);

Tool make_read_file_tool(FileAccessPolicy policy);
Tool make_write_file_tool(FileAccessPolicy policy);
Tool make_list_directory_tool();

} // namespace toolgate::tools
