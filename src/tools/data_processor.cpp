#include "toolgate/tools/data_processor.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/util/json.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <random>
#include <unordered_set>

namespace toolgate::tools
{

namespace
{

using util::json::value_or;

bool all_objects(const Json& data)
{
    return std::all_of(data.begin(), data.end(), [](const Json& v) { return v.is_object(); });
}

/// Display form used for grouping and uniqueness: strings unquoted, everything else dumped
std::string key_string(const Json& v)
{
    return v.is_string() ? v.get<std::string>() : v.dump();
}

struct NumericValues
{
    std::vector<double> values;
    bool all_integers{true};
};

NumericValues numeric_values(const Json& data, const Json& options)
{
    NumericValues out;
    const auto field = value_or<std::string>(options, "field", "");
    const bool by_field = !field.empty() && all_objects(data);
    for (const auto& item : data)
    {
        const Json* v = &item;
        if (by_field)
        {
            auto it = item.find(field);
            if (it == item.end())
                continue;
            v = &*it;
        }
        if (!v->is_number() || v->is_boolean())
            continue;
        if (!v->is_number_integer())
            out.all_integers = false;
        out.values.push_back(v->get<double>());
    }
    return out;
}

Json as_number(double v, bool integral)
{
    if (integral && std::abs(v) < 9.0e15)
        return static_cast<long long>(std::llround(v));
    return v;
}

double median_of(std::vector<double> v)
{
    std::sort(v.begin(), v.end());
    const size_t n = v.size();
    return n % 2 ? v[n / 2] : (v[n / 2 - 1] + v[n / 2]) / 2.0;
}

double mean_of(const std::vector<double>& v)
{
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double variance_of(const std::vector<double>& v)
{
    const double m = mean_of(v);
    double acc = 0;
    for (double x : v)
        acc += (x - m) * (x - m);
    return acc / static_cast<double>(v.size() - 1);
}

/// Most common value; ties go to the value seen first
double mode_of(const std::vector<double>& v)
{
    std::map<double, size_t> counts;
    for (double x : v)
        ++counts[x];
    double best = v.front();
    size_t best_count = 0;
    for (double x : v)
    {
        if (counts[x] > best_count)
        {
            best = x;
            best_count = counts[x];
        }
    }
    return best;
}

bool contains_value(const Json& haystack, const Json& needle)
{
    if (haystack.is_array())
        return std::find(haystack.begin(), haystack.end(), needle) != haystack.end();
    if (haystack.is_string() && needle.is_string())
        return haystack.get<std::string>().find(needle.get<std::string>()) != std::string::npos;
    if (haystack.is_object() && needle.is_string())
        return haystack.contains(needle.get<std::string>());
    return false;
}

bool compare_values(const Json& lhs, const Json& rhs, const std::string& op)
{
    if (op == "==")
        return lhs == rhs;
    if (op == "!=")
        return lhs != rhs;
    if (op == "in")
        return contains_value(rhs, lhs);
    if (op == "not_in")
        return !contains_value(rhs, lhs);
    if (op == "contains")
        return contains_value(lhs, rhs);

    // Ordering only between comparable values
    const bool comparable =
        (lhs.is_number() && rhs.is_number()) || (lhs.is_string() && rhs.is_string());
    if (!comparable)
        return false;
    if (op == ">")
        return lhs > rhs;
    if (op == ">=")
        return lhs >= rhs;
    if (op == "<")
        return lhs < rhs;
    if (op == "<=")
        return lhs <= rhs;
    throw ValidationError("unknown comparison operator: " + op);
}

Json filter_data(const Json& data, const Json& options)
{
    const auto field = value_or<std::string>(options, "field", "");
    if (field.empty())
        return data;
    const auto op = value_or<std::string>(options, "operator", "==");
    const Json value = options.contains("value") ? options["value"] : Json();

    Json out = Json::array();
    for (const auto& item : data)
    {
        if (!item.is_object())
            continue;
        const Json item_value = item.contains(field) ? item[field] : Json();
        if (compare_values(item_value, value, op))
            out.push_back(item);
    }
    return out;
}

Json map_data(const Json& data, const Json& options)
{
    const auto field = value_or<std::string>(options, "field", "");
    if (field.empty())
        return data;

    Json out = Json::array();
    for (const auto& item : data)
    {
        if (item.is_object())
            out.push_back(item.contains(field) ? item[field] : Json());
        else
            out.push_back(item);
    }
    return out;
}

Json reduce_data(const Json& data, const Json& options)
{
    const auto op = value_or<std::string>(options, "reduce_operation", "sum");

    if (op == "count")
        return data.size();
    if (op == "concat")
    {
        std::string out;
        for (const auto& item : data)
            out += key_string(item);
        return out;
    }
    if (op == "sum" || op == "product")
    {
        const Json initial = options.contains("initial") ? options["initial"] : Json(0);
        if (!initial.is_number())
            throw ValidationError("reduce initial value must be a number");

        bool integral = initial.is_number_integer();
        double acc = initial.get<double>();
        if (op == "product" && acc == 0)
            acc = 1;
        for (const auto& item : data)
        {
            if (!item.is_number())
                throw ValidationError("cannot " + op + " non-numeric value " + item.dump());
            integral = integral && item.is_number_integer();
            acc = op == "sum" ? acc + item.get<double>() : acc * item.get<double>();
        }
        return as_number(acc, integral);
    }
    return data;
}

Json sort_data(const Json& data, const Json& options)
{
    const bool reverse = value_or<bool>(options, "reverse", false);
    const auto key = value_or<std::string>(options, "key", "");

    std::vector<Json> items(data.begin(), data.end());
    if (!key.empty() && all_objects(data))
    {
        std::stable_sort(items.begin(), items.end(),
                         [&key](const Json& a, const Json& b)
                         {
                             const Json av = a.contains(key) ? a[key] : Json("");
                             const Json bv = b.contains(key) ? b[key] : Json("");
                             return av < bv;
                         });
    }
    else
    {
        std::stable_sort(items.begin(), items.end());
    }
    if (reverse)
        std::reverse(items.begin(), items.end());
    return Json(items);
}

Json group_data(const Json& data, const Json& options)
{
    const auto field = value_or<std::string>(options, "field", "");
    if (field.empty())
        return Json{{"all", data}};

    Json groups = Json::object();
    for (const auto& item : data)
    {
        if (!item.is_object())
            continue;
        const std::string key = item.contains(field) ? key_string(item[field]) : "unknown";
        if (!groups.contains(key))
            groups[key] = Json::array();
        groups[key].push_back(item);
    }
    return groups;
}

Json aggregate_data(const Json& data, const Json& options)
{
    const Json aggregations =
        options.contains("aggregations") ? options["aggregations"] : Json::array({"count"});
    if (!aggregations.is_array())
        throw ValidationError("aggregations must be a list");

    const auto nums = numeric_values(data, options);
    const auto& values = nums.values;

    Json out = Json::object();
    for (const auto& agg_json : aggregations)
    {
        const auto agg = agg_json.get<std::string>();
        if (agg == "count")
            out["count"] = data.size();
        if (values.empty())
            continue;
        if (agg == "sum")
            out["sum"] = as_number(std::accumulate(values.begin(), values.end(), 0.0),
                                   nums.all_integers);
        else if (agg == "avg")
            out["avg"] = mean_of(values);
        else if (agg == "min")
            out["min"] = as_number(*std::min_element(values.begin(), values.end()),
                                   nums.all_integers);
        else if (agg == "max")
            out["max"] = as_number(*std::max_element(values.begin(), values.end()),
                                   nums.all_integers);
        else if (agg == "median")
            out["median"] = median_of(values);
        else if (agg == "mode")
            out["mode"] = as_number(mode_of(values), nums.all_integers);
    }
    return out;
}

Json unique_data(const Json& data, const Json& options)
{
    const auto field = value_or<std::string>(options, "field", "");
    const bool by_field = !field.empty() && all_objects(data);

    std::unordered_set<std::string> seen;
    Json out = Json::array();
    for (const auto& item : data)
    {
        const std::string key =
            by_field ? (item.contains(field) ? item[field].dump() : "null") : key_string(item);
        if (seen.insert(key).second)
            out.push_back(item);
    }
    return out;
}

Json sample_data(const Json& data, const Json& options)
{
    const auto size = value_or<long long>(options, "size", 10);
    if (size < 0)
        throw ValidationError("sample size must not be negative");

    std::mt19937_64 rng;
    if (options.contains("seed") && options["seed"].is_number_integer())
        rng.seed(options["seed"].get<unsigned long long>());
    else
        rng.seed(std::random_device{}());

    std::vector<Json> items(data.begin(), data.end());
    std::shuffle(items.begin(), items.end(), rng);
    items.resize(std::min(items.size(), static_cast<size_t>(size)));
    return Json(items);
}

using Operation = Json (*)(const Json&, const Json&);

const std::vector<std::pair<std::string, Operation>>& operation_table()
{
    static const std::vector<std::pair<std::string, Operation>> table = {
        {"filter", &filter_data},       {"map", &map_data},
        {"reduce", &reduce_data},       {"sort", &sort_data},
        {"group", &group_data},         {"aggregate", &aggregate_data},
        {"unique", &unique_data},       {"sample", &sample_data},
        {"statistics", &compute_statistics},
    };
    return table;
}

} // namespace

const std::vector<std::string>& data_operations()
{
    static const std::vector<std::string> names = []
    {
        std::vector<std::string> out;
        for (const auto& entry : operation_table())
            out.push_back(entry.first);
        return out;
    }();
    return names;
}

Json compute_statistics(const Json& data, const Json& options)
{
    const auto nums = numeric_values(data, options);
    const auto& values = nums.values;
    if (values.empty())
        return Json{{"error", "No numeric values found"}};

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    const bool ints = nums.all_integers;

    Json stats = {
        {"count", values.size()},
        {"sum", as_number(std::accumulate(values.begin(), values.end(), 0.0), ints)},
        {"mean", mean_of(values)},
        {"median", median_of(values)},
        {"min", as_number(sorted.front(), ints)},
        {"max", as_number(sorted.back(), ints)},
        {"range", as_number(sorted.back() - sorted.front(), ints)},
    };

    if (values.size() > 1)
    {
        const double var = variance_of(values);
        stats["variance"] = var;
        stats["stdev"] = std::sqrt(var);
    }

    if (values.size() >= 4)
    {
        const size_t n = sorted.size();
        stats["q1"] = as_number(sorted[n / 4], ints);
        stats["q3"] = as_number(sorted[3 * n / 4], ints);
        stats["iqr"] = as_number(sorted[3 * n / 4] - sorted[n / 4], ints);
    }

    // Ten most common values, ties in first-seen order
    std::vector<std::pair<double, size_t>> counts;
    for (double v : values)
    {
        auto it = std::find_if(counts.begin(), counts.end(),
                               [v](const std::pair<double, size_t>& c) { return c.first == v; });
        if (it == counts.end())
            counts.emplace_back(v, 1);
        else
            ++it->second;
    }
    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (counts.size() > 10)
        counts.resize(10);

    Json frequency = Json::object();
    for (const auto& [value, count] : counts)
        frequency[as_number(value, ints).dump()] = count;
    stats["frequency"] = frequency;

    return stats;
}

Json process_data(const Json& data, const std::string& operation, const Json& options)
{
    const auto& table = operation_table();
    auto it = std::find_if(table.begin(), table.end(),
                           [&operation](const auto& entry) { return entry.first == operation; });
    if (it == table.end())
        return Json{{"success", false},
                    {"error", "Unknown operation: " + operation},
                    {"available_operations", data_operations()}};

    if (!data.is_array())
        return Json{{"success", false}, {"error", "data must be a list"}};

    const Json opts = options.is_object() ? options : Json::object();
    try
    {
        return Json{{"success", true},
                    {"operation", operation},
                    {"input_count", data.size()},
                    {"result", it->second(data, opts)}};
    }
    catch (const ValidationError& e)
    {
        return Json{{"success", false}, {"error", e.what()}};
    }
    catch (const Json::exception& e)
    {
        return Json{{"success", false}, {"error", e.what()}};
    }
}

Tool make_data_processor_tool()
{
    Json schema = {
        {"type", "object"},
        {"properties", Json{{"data", Json{{"type", "array"}}},
                            {"operation", Json{{"type", "string"}, {"enum", data_operations()}}},
                            {"options", Json{{"type", "object"}}}}},
        {"required", Json::array({"data", "operation"})}};

    return Tool("process_data", "Process data with filter, map, reduce, sort and statistics",
                schema,
                [](const Json& args)
                {
                    if (!args.contains("data"))
                        throw ValidationError("argument 'data' is required");
                    if (!args.contains("operation") || !args["operation"].is_string())
                        throw ValidationError("argument 'operation' must be a string");
                    const Json options =
                        args.contains("options") && args["options"].is_object()
                            ? args["options"]
                            : Json::object();
                    return process_data(args["data"], args["operation"].get<std::string>(),
                                        options);
                });
}

} // namespace toolgate::tools
