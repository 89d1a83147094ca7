#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "batch_types.hpp"
#include "run_context.hpp"

inline constexpr char kHiddenPrefix = '.';

struct ScanOptions {
  bool recursive = false;
  // Allow-list of extensions ("jpg", ".png"); empty accepts everything.
  std::vector<std::string> extensions;
  bool case_insensitive = true;
  // Yield dot-files and descend into dot-directories.
  bool include_hidden = false;
};

// Lazy, iterative walk over a directory tree. Directories are listed one at a
// time from an explicit work list; each listing is a snapshot so files renamed
// while the walk is in progress are not reported twice.
class DirectoryScanner {
public:
  // Throws std::runtime_error when root is missing, not a directory, or
  // cannot be listed.
  DirectoryScanner(const std::filesystem::path& root, ScanOptions options, RunContext ctx);

  // Next eligible file, or nullopt once the tree is exhausted or the batch was
  // cancelled.
  std::optional<FileEntry> next();

  const std::filesystem::path& root() const { return root_; }
  std::size_t directories_listed() const { return directories_listed_; }
  std::size_t directories_skipped() const { return directories_skipped_; }

private:
  void list_directory(const std::filesystem::path& directory);
  bool matches_filter(const std::string& extension) const;

  std::filesystem::path root_;
  ScanOptions options_;
  RunContext ctx_;
  std::unordered_set<std::string> filter_;
  std::deque<std::filesystem::path> pending_directories_;
  std::deque<FileEntry> ready_;
  std::size_t directories_listed_ = 0;
  std::size_t directories_skipped_ = 0;
};
