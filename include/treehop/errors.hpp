#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace treehop {

// The input directory is empty, missing or cannot be inspected.
class ContextDetectionError : public std::runtime_error {
public:
  ContextDetectionError(std::string path, std::string message);

  [[nodiscard]] const std::string &path() const { return path_; }
  [[nodiscard]] const std::string &message() const { return message_; }

private:
  std::string path_;
  std::string message_;
};

// An identifier was rejected: empty, path traversal, or a target that
// escapes the configured base directory.
class ResolutionError : public std::runtime_error {
public:
  ResolutionError(std::string identifier, std::string context_path, std::string message,
                  std::vector<std::string> suggestions = {});

  [[nodiscard]] const std::string &identifier() const { return identifier_; }
  [[nodiscard]] const std::string &context_path() const { return context_path_; }
  [[nodiscard]] const std::string &message() const { return message_; }
  [[nodiscard]] const std::vector<std::string> &suggestions() const { return suggestions_; }

private:
  std::string identifier_;
  std::string context_path_;
  std::string message_;
  std::vector<std::string> suggestions_;
};

class GitRepositoryError : public std::runtime_error {
public:
  GitRepositoryError(const std::filesystem::path &path, const std::string &message);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

class ConfigError : public std::runtime_error {
public:
  ConfigError(const std::filesystem::path &path, const std::string &message);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace treehop
