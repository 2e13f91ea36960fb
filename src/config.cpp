#include "treehop/config.hpp"

#include "treehop/consts.hpp"
#include "treehop/errors.hpp"
#include "treehop/fs.hpp"
#include "treehop/util.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace stdfs = std::filesystem;

namespace {

constexpr std::string_view kKeyProjects = "projects_dir";
constexpr std::string_view kKeyWorktrees = "worktrees_dir";
constexpr std::string_view kKeyCacheTtl = "cache_ttl";
constexpr std::string_view kKeyValidateGit = "validate_git";
constexpr std::string_view kKeyVerbose = "verbose";

std::string home_dir(const treehop::EnvLookup &env) {
  if (auto home = env("HOME"); home && !home->empty())
    return *home;
  std::error_code ec;
  auto cwd = stdfs::current_path(ec);
  return ec ? std::string("/tmp") : cwd.string();
}

stdfs::path expand_home(const std::string &value, const treehop::EnvLookup &env) {
  if (value == "~")
    return home_dir(env);
  if (value.rfind("~/", 0) == 0)
    return stdfs::path(home_dir(env)) / value.substr(2);
  return value;
}

bool parse_bool(const stdfs::path &source, std::string_view key, const std::string &raw) {
  const std::string v = treehop::strutil::to_lower(treehop::strutil::trim(raw));
  if (v == "true" || v == "yes" || v == "1" || v == "on")
    return true;
  if (v == "false" || v == "no" || v == "0" || v == "off")
    return false;
  throw treehop::ConfigError(source, std::string(key) + ": not a boolean: '" + raw + "'");
}

// Applies one key; unknown keys are ignored so newer files keep working.
void apply(treehop::Config &cfg, const stdfs::path &source, std::string_view key,
           const std::string &value, const treehop::EnvLookup &env) {
  if (key == kKeyProjects) {
    cfg.projects_dir = expand_home(value, env);
  } else if (key == kKeyWorktrees) {
    cfg.worktrees_dir = expand_home(value, env);
  } else if (key == kKeyCacheTtl) {
    cfg.cache_ttl = value;
  } else if (key == kKeyValidateGit) {
    cfg.validate_git = parse_bool(source, key, value);
  } else if (key == kKeyVerbose) {
    cfg.verbose = parse_bool(source, key, value);
  }
}

void load_file(treehop::Config &cfg, const stdfs::path &file, const treehop::EnvLookup &env) {
  if (file.empty() || !treehop::fs::exists(file))
    return;
  auto text = treehop::fs::read_text(file);
  if (!text)
    throw treehop::ConfigError(file, "cannot read config file");

  std::istringstream iss(*text);
  std::string line;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const std::string trimmed = treehop::strutil::trim(line);
    if (trimmed.empty() || trimmed[0] == '#')
      continue; // allow comments
    const auto colon = trimmed.find(':');
    if (colon == std::string::npos)
      throw treehop::ConfigError(file, "line " + std::to_string(lineno) + ": expected 'key: value'");
    const std::string key = treehop::strutil::trim(std::string_view(trimmed).substr(0, colon));
    const std::string value = treehop::strutil::trim(std::string_view(trimmed).substr(colon + 1));
    apply(cfg, file, key, value, env);
  }
}

void load_env(treehop::Config &cfg, const treehop::EnvLookup &env) {
  for (const std::string_view key :
       {kKeyProjects, kKeyWorktrees, kKeyCacheTtl, kKeyValidateGit, kKeyVerbose}) {
    std::string var(treehop::consts::kEnvPrefix);
    for (char c : key)
      var.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (auto value = env(var); value && !value->empty())
      apply(cfg, "$" + var, key, *value, env);
  }
}

} // namespace

namespace treehop {

EnvLookup process_env() {
  return [](std::string_view name) -> std::optional<std::string> {
    const char *v = std::getenv(std::string(name).c_str());
    if (!v)
      return std::nullopt;
    return std::string(v);
  };
}

Config default_config(const EnvLookup &env) {
  const stdfs::path home = home_dir(env);
  Config cfg;
  cfg.projects_dir = home / "Projects";
  cfg.worktrees_dir = home / "Worktrees";
  cfg.cache_ttl = std::string(consts::kDefaultCacheTtlText);
  return cfg;
}

stdfs::path default_config_path(const EnvLookup &env) {
  if (auto explicit_path = env("TREEHOP_CONFIG"); explicit_path && !explicit_path->empty())
    return expand_home(*explicit_path, env);
  if (auto xdg = env("XDG_CONFIG_HOME"); xdg && !xdg->empty())
    return stdfs::path(*xdg) / consts::kAppName / "config";
  return stdfs::path(home_dir(env)) / ".config" / consts::kAppName / "config";
}

Config load_config(const stdfs::path &file, const EnvLookup &env) {
  Config cfg = default_config(env);
  load_file(cfg, file, env);
  load_env(cfg, env);
  cfg.projects_dir = cfg.projects_dir.lexically_normal();
  cfg.worktrees_dir = cfg.worktrees_dir.lexically_normal();
  validate(cfg);
  return cfg;
}

Config load_config() {
  const auto env = process_env();
  return load_config(default_config_path(env), env);
}

void validate(const Config &cfg) {
  std::string problems;
  if (!cfg.projects_dir.is_absolute())
    problems += "projects_dir must be an absolute path; ";
  if (!cfg.worktrees_dir.is_absolute())
    problems += "worktrees_dir must be an absolute path; ";
  if (!problems.empty()) {
    problems.resize(problems.size() - 2);
    throw ConfigError({}, "validation failed: " + problems);
  }
}

std::optional<std::chrono::milliseconds> parse_duration(std::string_view text) {
  if (text.empty())
    return std::nullopt;
  if (text == "0")
    return std::chrono::milliseconds{0};

  double total_ms = 0;
  while (!text.empty()) {
    std::size_t i = 0;
    while (i < text.size() && (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.'))
      ++i;
    if (i == 0)
      return std::nullopt;
    const std::string number(text.substr(0, i));
    char *end = nullptr;
    const double value = std::strtod(number.c_str(), &end);
    if (end != number.c_str() + number.size())
      return std::nullopt;
    text.remove_prefix(i);

    std::size_t j = 0;
    while (j < text.size() && std::isalpha(static_cast<unsigned char>(text[j])))
      ++j;
    const std::string_view unit = text.substr(0, j);
    text.remove_prefix(j);

    if (unit == "ns")
      total_ms += value / 1e6;
    else if (unit == "us")
      total_ms += value / 1e3;
    else if (unit == "ms")
      total_ms += value;
    else if (unit == "s")
      total_ms += value * 1e3;
    else if (unit == "m")
      total_ms += value * 60e3;
    else if (unit == "h")
      total_ms += value * 3600e3;
    else
      return std::nullopt;
  }
  // Out-of-range durations are malformed, not clamped.
  if (!std::isfinite(total_ms) ||
      total_ms >= static_cast<double>(std::chrono::milliseconds::max().count()))
    return std::nullopt;
  return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(total_ms)};
}

} // namespace treehop
