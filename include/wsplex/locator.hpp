// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file locator.hpp
 * @brief Upward directory walk that finds a workspace's backend socket.
 *
 * A @c socket_locator maps a caller-supplied directory to the nearest
 * ancestor (the directory itself included) holding the well-known socket
 * file.  Results, negative ones included, are cached per canonical
 * directory for a fixed time-to-live.  All member functions are safe to
 * call concurrently.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace wsplex {

namespace fs = std::filesystem;

class socket_locator {
 public:
  using clock_t = std::chrono::steady_clock;

  socket_locator(std::string socket_name, std::chrono::milliseconds ttl);

  socket_locator(const socket_locator&) = delete;
  socket_locator(socket_locator&&) = delete;
  socket_locator& operator=(const socket_locator&) = delete;
  socket_locator& operator=(socket_locator&&) = delete;
  ~socket_locator() = default;

  /** @brief Socket path serving @p start_dir, or empty if none exists.
   *
   * A cached answer younger than the TTL is returned without touching the
   * filesystem.  Otherwise the walk runs from the canonical form of
   * @p start_dir up to the filesystem root and its outcome is cached.
   */
  std::optional<fs::path> locate(const fs::path& start_dir);

  /** @brief Forget what is cached for @p start_dir.
   *
   * Entries of other directories that resolved to the same socket are
   * dropped as well, so a restarted backend is found on the next lookup.
   */
  void invalidate(const fs::path& start_dir);

  // Number of filesystem walks performed so far.
  [[nodiscard]] std::size_t walk_count() const { return walks.load(); }

  [[nodiscard]] const std::string& socket_name() const { return name; }

  // Absolute, symlink-resolved, normalized form of @p dir.
  static fs::path canonical_key(const fs::path& dir);

 private:
  struct entry {
    std::optional<fs::path> socket;
    clock_t::time_point recorded_at;
  };

  std::optional<fs::path> walk(const fs::path& from) const;

  std::string name;
  std::chrono::milliseconds ttl;
  std::mutex mutex;
  std::unordered_map<std::string, entry> cache;
  std::atomic<std::size_t> walks{0};
};

}  // namespace wsplex
