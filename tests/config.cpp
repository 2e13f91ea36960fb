#include "treehop/config.hpp"
#include "treehop/errors.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <utility>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static treehop::EnvLookup fake_env(std::map<std::string, std::string> vars) {
  return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
    const auto it = vars.find(std::string(name));
    if (it == vars.end())
      return std::nullopt;
    return it->second;
  };
}

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static bool throws_config_error(const fs::path &file, const treehop::EnvLookup &env) {
  try {
    (void)treehop::load_config(file, env);
  } catch (const treehop::ConfigError &) {
    return true;
  }
  return false;
}

static int check_defaults(const fs::path &root) {
  const auto env = fake_env({{"HOME", "/home/u"}});
  const auto cfg = treehop::load_config(root / "absent", env);
  if (cfg.projects_dir != "/home/u/Projects" || cfg.worktrees_dir != "/home/u/Worktrees" ||
      cfg.cache_ttl != "5s" || !cfg.validate_git || cfg.verbose) {
    std::cerr << "defaults: got " << cfg.projects_dir << " " << cfg.worktrees_dir << " "
              << cfg.cache_ttl << "\n";
    return 1;
  }
  return 0;
}

static int check_config_path() {
  if (treehop::default_config_path(fake_env({{"HOME", "/home/u"}})) !=
      "/home/u/.config/treehop/config") {
    std::cerr << "config path: home fallback\n";
    return 1;
  }
  if (treehop::default_config_path(fake_env({{"HOME", "/home/u"}, {"XDG_CONFIG_HOME", "/xdg"}})) !=
      "/xdg/treehop/config") {
    std::cerr << "config path: XDG_CONFIG_HOME ignored\n";
    return 1;
  }
  if (treehop::default_config_path(fake_env({{"HOME", "/home/u"},
                                             {"XDG_CONFIG_HOME", "/xdg"},
                                             {"TREEHOP_CONFIG", "~/th.conf"}})) !=
      "/home/u/th.conf") {
    std::cerr << "config path: TREEHOP_CONFIG not preferred\n";
    return 1;
  }
  return 0;
}

static int check_file_and_env(const fs::path &root) {
  const auto file = root / "config";
  write_file(file, "# treehop settings\n"
                   "\n"
                   "projects_dir: ~/code\n"
                   "  worktrees_dir: /srv/./wt  \n"
                   "cache_ttl: 250ms\n"
                   "validate_git: no\n"
                   "colour: always\n");

  const auto env = fake_env({{"HOME", "/home/u"}});
  auto cfg = treehop::load_config(file, env);
  if (cfg.projects_dir != "/home/u/code" || cfg.worktrees_dir != "/srv/wt" ||
      cfg.cache_ttl != "250ms" || cfg.validate_git) {
    std::cerr << "file: got " << cfg.projects_dir << " " << cfg.worktrees_dir << " "
              << cfg.cache_ttl << "\n";
    return 1;
  }

  const auto overridden = fake_env({{"HOME", "/home/u"},
                                    {"TREEHOP_WORKTREES_DIR", "/mnt/wt"},
                                    {"TREEHOP_CACHE_TTL", "1m"},
                                    {"TREEHOP_VERBOSE", "on"},
                                    {"TREEHOP_VALIDATE_GIT", ""}});
  cfg = treehop::load_config(file, overridden);
  if (cfg.projects_dir != "/home/u/code" || cfg.worktrees_dir != "/mnt/wt" ||
      cfg.cache_ttl != "1m" || !cfg.verbose || cfg.validate_git) {
    std::cerr << "env: overrides not applied over the file\n";
    return 1;
  }
  return 0;
}

static int check_invalid(const fs::path &root) {
  const auto env = fake_env({{"HOME", "/home/u"}});

  write_file(root / "relative", "projects_dir: code\n");
  if (!throws_config_error(root / "relative", env)) {
    std::cerr << "invalid: relative projects_dir accepted\n";
    return 1;
  }
  write_file(root / "badbool", "verbose: sometimes\n");
  if (!throws_config_error(root / "badbool", env)) {
    std::cerr << "invalid: bad boolean accepted\n";
    return 1;
  }
  write_file(root / "nocolon", "projects_dir /x\n");
  if (!throws_config_error(root / "nocolon", env)) {
    std::cerr << "invalid: line without ':' accepted\n";
    return 1;
  }
  if (!throws_config_error(root / "absent",
                           fake_env({{"HOME", "/home/u"}, {"TREEHOP_PROJECTS_DIR", "rel"}}))) {
    std::cerr << "invalid: relative directory from environment accepted\n";
    return 1;
  }
  return 0;
}

static int check_durations() {
  using treehop::parse_duration;
  const std::pair<std::string, std::chrono::milliseconds> good[] = {
      {"5s", 5s},        {"300ms", 300ms}, {"1m30s", 90s}, {"1.5h", 90min},
      {"0", 0ms},        {"1500us", 1ms},  {"2ns", 0ms},   {"0.25s", 250ms},
  };
  for (const auto &[text, want] : good) {
    const auto got = parse_duration(text);
    if (!got || *got != want) {
      std::cerr << "duration '" << text << "' parsed wrong\n";
      return 1;
    }
  }
  // Larger than milliseconds can hold.
  for (const std::string bad : {"", "5", "s", "5x", "-1s", "1s ", "ms5", "99999999999999999999h",
                                "9223372036854775807s"}) {
    if (parse_duration(bad)) {
      std::cerr << "duration '" << bad << "' accepted\n";
      return 1;
    }
  }
  return 0;
}

int main() {
  const fs::path root = fs::weakly_canonical(fs::temp_directory_path()) /
                        ("treehop_config_" + std::to_string(std::random_device{}()));
  int rc = 0;
  try {
    fs::create_directories(root);
    rc = check_defaults(root);
    if (rc == 0)
      rc = check_config_path();
    if (rc == 0)
      rc = check_file_and_env(root);
    if (rc == 0)
      rc = check_invalid(root);
    if (rc == 0)
      rc = check_durations();
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  if (rc == 0)
    std::cout << "config OK\n";
  return rc;
}
