#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "toolgate/exceptions.hpp"
#include "toolgate/settings.hpp"

// Cross-platform setenv wrapper
static void set_env(const char* name, const char* value) {
#ifdef _WIN32
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

static void unset_env(const char* name) {
#ifdef _WIN32
  _putenv_s(name, "");
#else
  unsetenv(name);
#endif
}

template <typename F>
static bool throws_validation(F&& f) {
  try { f(); } catch (const toolgate::ValidationError&) { return true; }
  return false;
}

int main() {
  using namespace toolgate;

  // Defaults
  Settings d;
  d.validate();
  assert(d.server.port == 8000);
  assert(d.middleware.requests_per_minute == 60);
  assert((d.middleware.order == std::vector<std::string>{"auth", "logging", "rate_limit"}));
  assert(!d.auth.enabled);

  // JSON parse
  auto s = Settings::from_json(Json{{"log_level", "DEBUG"},
                                    {"environment", "production"},
                                    {"server", {{"port", 9000}}},
                                    {"middleware", {{"rate_limiting_enabled", true},
                                                    {"requests_per_minute", 5}}}});
  assert(s.log_level == "DEBUG");
  assert(s.environment == "production");
  assert(s.server.port == 9000);
  assert(s.server.host == "127.0.0.1");
  assert(s.middleware.rate_limiting_enabled);
  assert(s.middleware.requests_per_minute == 5);

  // Invalid values
  assert(throws_validation([] { Settings::from_json(Json{{"environment", "qa"}}); }));
  assert(throws_validation([] { Settings::from_json(Json{{"middleware", {{"requests_per_minute", -1}}}}); }));
  assert(throws_validation([] { Settings::from_json(Json{{"middleware", {{"order", Json::array({"auth", "cache"})}}}}); }));
  assert(throws_validation([] { Settings::from_json(Json{{"middleware", {{"order", Json::array({"auth", "auth", "logging"})}}}}); }));
  assert(throws_validation([] { Settings::from_json(Json{{"auth", {{"enabled", true}}}}); }));
  assert(throws_validation([] { Settings::from_json(Json{{"server", {{"port", "eighty"}}}}); }));
  // Enabled middleware must appear in the order
  assert(throws_validation([] { Settings::from_json(Json{{"middleware", {{"order", Json::array({"auth"})}}}}); }));
  // Disabled middleware may be omitted
  auto only_auth = Settings::from_json(Json{{"middleware", {{"logging_enabled", false}, {"order", Json::array({"auth"})}}}});
  assert(only_auth.middleware.order.size() == 1);

  // File loading
  const char* path = "toolgate_settings_test.json";
  {
    std::ofstream out(path);
    out << R"({"app_name": "from-file", "auth": {"enabled": true, "token": "secret"}})";
  }
  auto f = Settings::from_file(path);
  assert(f.app_name == "from-file");
  assert(f.auth.enabled && *f.auth.token == "secret");
  std::remove(path);

  bool missing = false;
  try { Settings::from_file("does-not-exist.json"); } catch (const NotFoundError&) { missing = true; }
  assert(missing);

  // Redacted serialization
  auto j = f.to_json();
  assert(j["app"]["name"] == "from-file");
  assert(j["features"]["auth_enabled"] == true);
  assert(j["features"]["auth_type"] == "bearer");
  assert(j.dump().find("secret") == std::string::npos);

  // Env parse (set locally)
  set_env("TOOLGATE_LOG_LEVEL", "warning");
  set_env("TOOLGATE_PORT", "8123");
  set_env("TOOLGATE_AUTH_TOKEN", "tok");
  set_env("TOOLGATE_RATE_LIMITING_ENABLED", "true");
  auto e = Settings::from_env();
  assert(e.log_level == "WARNING"); // uppercased
  assert(e.server.port == 8123);
  assert(e.auth.enabled && *e.auth.token == "tok");
  assert(e.middleware.rate_limiting_enabled);

  set_env("TOOLGATE_PORT", "80x");
  assert(throws_validation([] { Settings::from_env(); }));

  unset_env("TOOLGATE_LOG_LEVEL");
  unset_env("TOOLGATE_PORT");
  unset_env("TOOLGATE_AUTH_TOKEN");
  unset_env("TOOLGATE_RATE_LIMITING_ENABLED");
  return 0;
}
