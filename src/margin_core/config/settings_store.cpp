#include "margin_core/config/settings_store.hpp"

#include <iostream>
#include <utility>

namespace margin_core {

SettingsStore::SettingsStore(Settings initial) : settings_(std::move(initial)) {
  settings_.validate();
}

SettingsStore::SettingsStore(const std::filesystem::path& config_path)
    : settings_(Settings::from_file(config_path.string())), config_path_(config_path) {
  last_write_time_ = std::filesystem::last_write_time(config_path);
}

Settings SettingsStore::current() {
  std::lock_guard<std::mutex> lock(mutex_);
  reload_if_changed();
  return settings_;
}

std::uint64_t SettingsStore::version() {
  std::lock_guard<std::mutex> lock(mutex_);
  reload_if_changed();
  return version_;
}

void SettingsStore::update(const Settings& settings) {
  settings.validate();
  std::lock_guard<std::mutex> lock(mutex_);
  if (settings == settings_) {
    return;
  }
  settings_ = settings;
  ++version_;
}

void SettingsStore::reload_if_changed() {
  if (!config_path_) {
    return;
  }

  std::error_code ec;
  auto write_time = std::filesystem::last_write_time(*config_path_, ec);
  if (ec || write_time == last_write_time_) {
    return;
  }
  last_write_time_ = write_time;

  try {
    Settings reloaded = Settings::from_file(config_path_->string());
    if (!(reloaded == settings_)) {
      settings_ = std::move(reloaded);
      ++version_;
      std::cout << "[Settings] Reloaded " << config_path_->string() << std::endl;
    }
  } catch (const std::exception& e) {
    std::cerr << "[Settings] Warning: keeping previous settings, failed to reload "
              << config_path_->string() << ": " << e.what() << std::endl;
  }
}

}  // namespace margin_core
