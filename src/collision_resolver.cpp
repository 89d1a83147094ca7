#include "collision_resolver.hpp"

#include <system_error>

namespace fs = std::filesystem;

CollisionResolver::CollisionResolver(std::size_t max_attempts)
  : max_attempts_(max_attempts == 0 ? kMaxCollisionAttempts : max_attempts) {}

fs::path CollisionResolver::candidate(const fs::path& desired, std::size_t attempt) {
  if(attempt == 0) return desired;
  auto name = desired.stem().string() + "_" + std::to_string(attempt) + desired.extension().string();
  return desired.parent_path() / name;
}

std::string CollisionResolver::key_for(const fs::path& path) {
  return path.lexically_normal().string();
}

bool CollisionResolver::occupied_on_disk(const fs::path& path, const fs::path& owner) const {
  std::error_code ec;
  // symlink_status so that dangling links still count as taken
  auto status = fs::symlink_status(path, ec);
  if(ec) {
    // anything other than "not found" means we cannot prove the name is free
    return ec != std::errc::no_such_file_or_directory;
  }
  if(!fs::exists(status)) return false;
  if(owner.empty()) return true;
  std::error_code eq_ec;
  bool same_file = fs::equivalent(path, owner, eq_ec);
  return eq_ec || !same_file;
}

std::optional<fs::path> CollisionResolver::reserve(const fs::path& desired, const fs::path& owner) {
  for(std::size_t attempt = 0; attempt <= max_attempts_; ++attempt) {
    auto path = candidate(desired, attempt);
    // The disk check stays outside the lock. Committed paths are never
    // released, so a name consumed by another task is still seen as reserved.
    if(occupied_on_disk(path, owner)) continue;
    std::lock_guard<std::mutex> lock(mutex_);
    if(reserved_.insert(key_for(path)).second) {
      return path;
    }
  }
  return std::nullopt;
}

void CollisionResolver::release(const fs::path& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  reserved_.erase(key_for(path));
}

bool CollisionResolver::is_reserved(const fs::path& path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserved_.count(key_for(path)) > 0;
}

std::size_t CollisionResolver::reservation_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserved_.size();
}
