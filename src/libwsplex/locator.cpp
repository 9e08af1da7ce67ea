// SPDX-License-Identifier: MIT
#include "wsplex/locator.hpp"

#include <fmt/std.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "logger.hpp"

namespace wsplex {

namespace fs = std::filesystem;

socket_locator::socket_locator(
    std::string socket_name, std::chrono::milliseconds ttl)
    : name{std::move(socket_name)}, ttl{ttl} {}

fs::path socket_locator::canonical_key(const fs::path& dir) {
  std::error_code ec{};
  fs::path abs = fs::absolute(dir, ec);
  if (ec) abs = dir;

  fs::path canon = fs::weakly_canonical(abs, ec);
  if (ec) canon = abs.lexically_normal();

  // "/a/b/" and "/a/b" must share an entry
  while (!canon.has_filename() && canon.has_relative_path())
    canon = canon.parent_path();
  return canon;
}

std::optional<fs::path> socket_locator::walk(const fs::path& from) const {
  for (fs::path dir = from;; dir = dir.parent_path()) {
    auto probe = dir / name;
    std::error_code ec{};
    if (fs::exists(fs::symlink_status(probe, ec))) return probe;
    if (dir.parent_path() == dir || dir.empty()) return std::nullopt;
  }
}

std::optional<fs::path> socket_locator::locate(const fs::path& start_dir) {
  auto key = canonical_key(start_dir);
  auto now = clock_t::now();

  {
    std::lock_guard lock{mutex};
    if (auto it = cache.find(key.string());
        it != cache.end() && now - it->second.recorded_at < ttl) {
      LOG_TRACE(
          "locate {}: cached {}", key,
          it->second.socket ? it->second.socket->string() : "<none>");
      return it->second.socket;
    }
  }

  auto found = walk(key);
  ++walks;
  LOG_DEBUG(
      "locate {}: walked, found {}", key,
      found ? found->string() : "<none>");

  std::lock_guard lock{mutex};
  cache[key.string()] = entry{found, now};
  return found;
}

void socket_locator::invalidate(const fs::path& start_dir) {
  auto key = canonical_key(start_dir).string();

  std::lock_guard lock{mutex};
  auto it = cache.find(key);
  if (it == cache.end()) return;

  if (auto socket = it->second.socket) {
    std::erase_if(cache, [&](const auto& kv) {
      return kv.second.socket == socket;
    });
  } else {
    cache.erase(it);
  }
  LOG_DEBUG("invalidated socket cache for {}", key);
}

}  // namespace wsplex
