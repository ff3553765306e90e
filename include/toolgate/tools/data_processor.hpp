#pragma once
#include "toolgate/tools/tool.hpp"

#include <string>
#include <vector>

namespace toolgate::tools
{

/// Operation names accepted by process_data()
const std::vector<std::string>& data_operations();

/// Transform or summarize a JSON array.
///
/// Operations: filter, map, reduce, sort, group, aggregate, unique, sample, statistics.
/// Returns {"success": true, "operation", "input_count", "result"} or
/// {"success": false, "error", ...} for unknown operations and unusable input.
Json process_data(const Json& data, const std::string& operation,
                  const Json& options = Json::object());

/// Summary statistics of the numeric values in data (or of options.field in each object)
Json compute_statistics(const Json& data, const Json& options = Json::object());

/// "process_data" tool: arguments {data, operation, options}
Tool make_data_processor_tool();

} // namespace toolgate::tools
