#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace treehop {

struct Config {
  std::filesystem::path projects_dir;   // main checkouts: <projects_dir>/<project>
  std::filesystem::path worktrees_dir;  // linked worktrees: <worktrees_dir>/<project>/<branch>
  std::string cache_ttl = "5s";         // duration string, see parse_duration
  bool validate_git = true;             // only offer projects that open as repositories
  bool verbose = false;                 // report degraded completion sources on stderr
};

// Looks up an environment variable; std::nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Reads the real process environment.
auto process_env() -> EnvLookup;

// Defaults derived from $HOME: ~/Projects, ~/Worktrees.
auto default_config(const EnvLookup& env) -> Config;

// $TREEHOP_CONFIG, else $XDG_CONFIG_HOME/treehop/config, else ~/.config/treehop/config
auto default_config_path(const EnvLookup& env) -> std::filesystem::path;

// Layered load: defaults, then `file` (if present), then TREEHOP_* variables.
// Throws ConfigError on malformed values or relative directories.
auto load_config(const std::filesystem::path& file, const EnvLookup& env) -> Config;

// Same, using default_config_path() and the process environment.
auto load_config() -> Config;

// Throws ConfigError unless both directories are absolute.
void validate(const Config& cfg);

// Go-style durations: "300ms", "5s", "1m30s", "1.5h". Units ns, us, ms, s, m, h.
// Returns std::nullopt for empty or malformed input.
auto parse_duration(std::string_view text) -> std::optional<std::chrono::milliseconds>;

} // namespace treehop
