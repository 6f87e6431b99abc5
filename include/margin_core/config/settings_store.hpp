#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>

#include "margin_core/config/settings.hpp"

namespace margin_core {

// Thread-safe holder of the active Settings. When backed by a file, the file is
// re-read whenever its modification time changes, and every observed change
// bumps version() so that cached provider clients can be rebuilt.
class SettingsStore {
 public:
  explicit SettingsStore(Settings initial = Settings{});
  explicit SettingsStore(const std::filesystem::path& config_path);

  Settings current();
  std::uint64_t version();

  // Replaces the in-memory settings. Does not write back to disk.
  void update(const Settings& settings);

 private:
  void reload_if_changed();

  std::mutex mutex_;
  Settings settings_;
  std::uint64_t version_ = 1;
  std::optional<std::filesystem::path> config_path_;
  std::filesystem::file_time_type last_write_time_{};
};

}  // namespace margin_core
