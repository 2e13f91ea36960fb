#include "treehop/errors.hpp"

#include <utility>

namespace treehop {

namespace {

std::string resolution_what(const std::string &identifier, const std::string &context_path,
                            const std::string &message) {
  std::string out = "resolution failed for '" + identifier + "'";
  if (!context_path.empty())
    out += " (context: " + context_path + ")";
  return out + ": " + message;
}

} // namespace

ContextDetectionError::ContextDetectionError(std::string path, std::string message)
    : std::runtime_error("context detection failed for " + (path.empty() ? "<empty>" : path) +
                         ": " + message),
      path_(std::move(path)), message_(std::move(message)) {}

ResolutionError::ResolutionError(std::string identifier, std::string context_path,
                                 std::string message, std::vector<std::string> suggestions)
    : std::runtime_error(resolution_what(identifier, context_path, message)),
      identifier_(std::move(identifier)), context_path_(std::move(context_path)),
      message_(std::move(message)), suggestions_(std::move(suggestions)) {}

GitRepositoryError::GitRepositoryError(const std::filesystem::path &path,
                                       const std::string &message)
    : std::runtime_error("git repository operation failed for " + path.string() + ": " + message),
      path_(path) {}

ConfigError::ConfigError(const std::filesystem::path &path, const std::string &message)
    : std::runtime_error(path.empty() ? "config: " + message
                                      : "config " + path.string() + ": " + message),
      path_(path) {}

} // namespace treehop
