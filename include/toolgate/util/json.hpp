#pragma once
#include "toolgate/exceptions.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace toolgate::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }
inline std::string dump_pretty(const json& j, int indent = 2) { return j.dump(indent); }

/// Read an optional argument, falling back to def when absent or null
/// @throws ValidationError if the value has the wrong type
template <typename T>
inline T value_or(const json& obj, const std::string& key, T def)
{
  if (!obj.is_object()) return def;
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return def;
  try {
    return it->template get<T>();
  } catch (const json::type_error&) {
    throw ValidationError("argument '" + key + "' has the wrong type: " + it->dump());
  }
}

} // namespace toolgate::util::json
