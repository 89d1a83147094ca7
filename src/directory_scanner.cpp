#include "directory_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "utils.hpp"

namespace fs = std::filesystem;

DirectoryScanner::DirectoryScanner(const fs::path& root, ScanOptions options, RunContext ctx)
  : options_(std::move(options)),
    ctx_(std::move(ctx)) {
  std::error_code ec;
  root_ = fs::canonical(root, ec);
  if(ec) {
    log_error(ctx_.logger.get(), "Invalid directory '{}': {}", root.string(), ec.message());
    throw std::runtime_error("Invalid directory: " + root.string());
  }
  if(!fs::is_directory(root_, ec) || ec) {
    log_error(ctx_.logger.get(), "'{}' is not a directory", root_.string());
    throw std::runtime_error("Not a directory: " + root_.string());
  }
  fs::directory_iterator listing(root_, ec);
  if(ec) {
    log_error(ctx_.logger.get(), "Unable to list '{}': {}", root_.string(), ec.message());
    throw std::runtime_error("Inaccessible directory: " + root_.string());
  }

  for(const auto& ext : options_.extensions) {
    auto normalized = normalize_extension(ext, !options_.case_insensitive);
    if(!normalized.empty()) filter_.insert(std::move(normalized));
  }
  pending_directories_.push_back(root_);
}

std::optional<FileEntry> DirectoryScanner::next() {
  while(ready_.empty()) {
    if(pending_directories_.empty()) return std::nullopt;
    if(ctx_.cancelled()) {
      if(ctx_.logger) ctx_.logger->debug("Scan of '{}' stopped by cancellation", root_.string());
      pending_directories_.clear();
      return std::nullopt;
    }
    auto directory = std::move(pending_directories_.front());
    pending_directories_.pop_front();
    list_directory(directory);
  }
  FileEntry entry = std::move(ready_.front());
  ready_.pop_front();
  return entry;
}

bool DirectoryScanner::matches_filter(const std::string& extension) const {
  if(filter_.empty()) return true;
  if(extension.empty()) return false;
  if(!options_.case_insensitive) return filter_.count(extension) > 0;
  std::string folded = extension;
  std::transform(folded.begin(), folded.end(), folded.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return filter_.count(folded) > 0;
}

void DirectoryScanner::list_directory(const fs::path& directory) {
  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if(ec) {
    ++directories_skipped_;
    log_warn(ctx_.logger.get(), "Skipping directory '{}': {}", directory.string(), ec.message());
    return;
  }
  ++directories_listed_;

  const fs::directory_iterator end;
  for(; it != end; it.increment(ec)) {
    if(ec) break;
    const auto& item = *it;
    const auto name = item.path().filename().string();

    std::error_code status_ec;
    const auto link_status = item.symlink_status(status_ec);
    if(status_ec) {
      log_warn(ctx_.logger.get(), "Unable to stat '{}': {}", item.path().string(), status_ec.message());
      continue;
    }

    const bool hidden = !name.empty() && name.front() == kHiddenPrefix;
    if(fs::is_directory(link_status)) {
      if(options_.recursive && (!hidden || options_.include_hidden)) {
        pending_directories_.push_back(item.path());
      }
      continue;
    }

    if(hidden && !options_.include_hidden) continue;

    // symlinks to files are renamed as links; symlinks to directories are never followed
    if(!item.is_regular_file(status_ec) || status_ec) continue;

    FileEntry entry;
    entry.path = item.path();
    entry.name = name;
    entry.extension = item.path().extension().string();
    entry.hidden = hidden;
    if(!matches_filter(entry.extension)) continue;
    ready_.push_back(std::move(entry));
  }

  if(ec) {
    log_warn(ctx_.logger.get(), "Listing of '{}' ended early: {}", directory.string(), ec.message());
  }
}
