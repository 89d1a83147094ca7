#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

inline constexpr std::size_t kMaxCollisionAttempts = 10000;

// Hands out final target paths that are neither on disk nor claimed by another
// in-flight rename. The reservation table is the only state shared between
// rename tasks.
class CollisionResolver {
public:
  explicit CollisionResolver(std::size_t max_attempts = kMaxCollisionAttempts);

  // Reserve `desired`, or the first free "<stem>_N<ext>" candidate. `owner` is
  // the file being renamed; it does not count as occupying a candidate that
  // resolves to itself. Returns nullopt when every attempt is taken.
  std::optional<std::filesystem::path> reserve(const std::filesystem::path& desired,
                                               const std::filesystem::path& owner = {});

  // Drop a reservation whose rename was abandoned or failed. Paths that were
  // actually consumed stay reserved.
  void release(const std::filesystem::path& path);

  bool is_reserved(const std::filesystem::path& path) const;
  std::size_t reservation_count() const;

  static std::filesystem::path candidate(const std::filesystem::path& desired, std::size_t attempt);

private:
  static std::string key_for(const std::filesystem::path& path);
  bool occupied_on_disk(const std::filesystem::path& path, const std::filesystem::path& owner) const;

  std::size_t max_attempts_;
  mutable std::mutex mutex_;
  std::unordered_set<std::string> reserved_;
};
