#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "tg/fault.h"
#include "tg/outcome.h"

namespace tg::boundary {

struct PathGuardOptions {
  std::size_t audit_subject_max{64}; // bytes of a rejected candidate kept in Fault::subject
};

class PathGuard;

// A canonical absolute path proven to lie inside the root of the PathGuard
// that produced it. Only PathGuard constructs these.
class ValidatedPath {
public:
  const std::filesystem::path& Path() const noexcept { return path_; }
  const std::filesystem::path& Root() const noexcept { return root_; }
  std::filesystem::path Relative() const { return path_.lexically_relative(root_); }
  std::string Utf8() const;

private:
  friend class PathGuard;
  ValidatedPath(std::filesystem::path path, std::filesystem::path root)
      : path_(std::move(path)), root_(std::move(root)) {}

  std::filesystem::path path_;
  std::filesystem::path root_;
};

// Trust boundary for filesystem access below one directory. The root is
// canonicalized once in Create(); candidates are untrusted relative paths.
class PathGuard {
public:
  static Outcome<PathGuard> Create(const std::filesystem::path& root,
                                   PathGuardOptions options = {});

  // Resolves |candidate| (symlinks included) below the root. Lexical attacks
  // are rejected before the filesystem is touched.
  Outcome<ValidatedPath> Validate(std::string_view candidate) const;

  // For a target that may not exist yet: validates the parent directory and
  // appends the final component. Creates nothing.
  Outcome<ValidatedPath> ValidateForCreate(std::string_view candidate) const;

  const std::filesystem::path& Root() const noexcept { return root_; }
  const PathGuardOptions& Options() const noexcept { return options_; }

private:
  PathGuard(std::filesystem::path root, PathGuardOptions options)
      : root_(std::move(root)), options_(options) {}

  std::optional<Fault> CheckLexical(std::string_view candidate) const;
  Fault Traversal(std::string message, std::string_view candidate) const;
  bool Contains(const std::filesystem::path& resolved) const;

  std::filesystem::path root_;
  PathGuardOptions options_;
};

} // namespace tg::boundary
