#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "margin_core/config/settings.hpp"
#include "margin_core/config/settings_store.hpp"
#include "margin_core/types.hpp"
#include "../../common/utilities_test.hpp"

namespace margin_core {

class SettingsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    unsetenv("MARGIN_API_KEY");
    temp_dir_ = margin_tests::TestUtilities::create_temp_dir("settings");
    config_path_ = temp_dir_ / "marginrc.json";
  }

  void TearDown() override {
    unsetenv("MARGIN_API_KEY");
    margin_tests::TestUtilities::cleanup_temp_dir(temp_dir_);
  }

  void write_config(const std::string& content) {
    std::ofstream out(config_path_, std::ios::trunc);
    out << content;
  }

  // Pushes the mtime forward so the store notices the rewrite even within one clock tick
  void bump_mtime(int seconds) {
    std::filesystem::last_write_time(config_path_,
                                     std::filesystem::last_write_time(config_path_) + std::chrono::seconds(seconds));
  }

  std::filesystem::path temp_dir_;
  std::filesystem::path config_path_;
};

TEST_F(SettingsTest, EmptyJsonGivesDefaults) {
  Settings settings = Settings::from_json(nlohmann::json::object());

  EXPECT_EQ(settings.embedding_mode, EmbeddingMode::Auto);
  EXPECT_EQ(settings.chunk_size, 500);
  EXPECT_EQ(settings.chunk_overlap, 100);
  EXPECT_EQ(settings.standard_limit, 8);
  EXPECT_EQ(settings.subquery_limit, 6);
  EXPECT_EQ(settings.context_window, 8);
  EXPECT_EQ(settings.expanded_context_window, 12);
  EXPECT_EQ(settings.max_refinement_iterations, 1);
  EXPECT_EQ(settings.min_context_chars, 200);
  EXPECT_EQ(settings.hash_dimension, 768);
  EXPECT_EQ(settings.remote_batch_size, 100);
  EXPECT_TRUE(settings.remote_api_key.empty());
  EXPECT_EQ(settings, Settings{});
}

TEST_F(SettingsTest, JsonOverridesDefaults) {
  Settings settings = Settings::from_json({{"embedding_mode", "remote"},
                                           {"remote_api_key", "abc"},
                                           {"data_dir", "/tmp/margin"},
                                           {"chunk_size", 200},
                                           {"chunk_overlap", 20}});

  EXPECT_EQ(settings.embedding_mode, EmbeddingMode::Remote);
  EXPECT_EQ(settings.remote_api_key, "abc");
  EXPECT_EQ(settings.chunk_size, 200);
  EXPECT_EQ(settings.chunk_overlap, 20);
  EXPECT_EQ(settings.vector_store_dir(), std::filesystem::path("/tmp/margin") / "vector-store");
  EXPECT_EQ(settings.metadata_db_path(), std::filesystem::path("/tmp/margin") / "metadata.db");
}

TEST_F(SettingsTest, WrongTypeFallsBackToDefault) {
  Settings settings = Settings::from_json({{"chunk_size", "large"}});
  EXPECT_EQ(settings.chunk_size, 500);
}

TEST_F(SettingsTest, UnknownModeIsRejected) {
  EXPECT_THROW(Settings::from_json({{"embedding_mode", "cloud"}}), std::runtime_error);
}

TEST_F(SettingsTest, OverlapMustBeSmallerThanChunk) {
  EXPECT_THROW(Settings::from_json({{"chunk_size", 100}, {"chunk_overlap", 100}}), std::runtime_error);
}

TEST_F(SettingsTest, ExpandedWindowCannotShrink) {
  EXPECT_THROW(Settings::from_json({{"context_window", 10}, {"expanded_context_window", 5}}), std::runtime_error);
}

TEST_F(SettingsTest, EnvironmentKeyWins) {
  setenv("MARGIN_API_KEY", "from-env", 1);
  Settings settings = Settings::from_json({{"remote_api_key", "from-file"}});
  EXPECT_EQ(settings.remote_api_key, "from-env");
}

TEST_F(SettingsTest, MissingFileThrows) {
  EXPECT_THROW(Settings::from_file((temp_dir_ / "missing.json").string()), std::runtime_error);
}

TEST_F(SettingsTest, StoreVersionChangesOnlyOnRealUpdate) {
  SettingsStore store;
  const auto initial = store.version();

  store.update(store.current());
  EXPECT_EQ(store.version(), initial);

  Settings changed = store.current();
  changed.embedding_mode = EmbeddingMode::Local;
  store.update(changed);
  EXPECT_EQ(store.version(), initial + 1);
  EXPECT_EQ(store.current().embedding_mode, EmbeddingMode::Local);
}

TEST_F(SettingsTest, StoreRejectsInvalidUpdate) {
  SettingsStore store;
  Settings invalid = store.current();
  invalid.chunk_size = 0;
  EXPECT_THROW(store.update(invalid), std::runtime_error);
  EXPECT_EQ(store.current().chunk_size, 500);
}

TEST_F(SettingsTest, StoreReloadsChangedFile) {
  write_config(R"({"embedding_mode": "auto"})");
  SettingsStore store(config_path_);
  const auto initial = store.version();

  write_config(R"({"embedding_mode": "local"})");
  bump_mtime(5);

  EXPECT_EQ(store.current().embedding_mode, EmbeddingMode::Local);
  EXPECT_EQ(store.version(), initial + 1);
}

TEST_F(SettingsTest, StoreKeepsSettingsWhenReloadFails) {
  write_config(R"({"chunk_size": 300, "chunk_overlap": 30})");
  SettingsStore store(config_path_);

  write_config("{ not json");
  bump_mtime(5);

  EXPECT_EQ(store.current().chunk_size, 300);
}

TEST(EmbeddingTierTest, StringConversions) {
  EXPECT_EQ(to_string(EmbeddingTier::Local), "local");
  EXPECT_EQ(to_string(EmbeddingTier::Remote), "remote");
  EXPECT_EQ(to_string(EmbeddingTier::Hash), "hash");
  EXPECT_EQ(embedding_tier_from_string("remote"), EmbeddingTier::Remote);
  EXPECT_THROW(embedding_tier_from_string("gpu"), std::invalid_argument);
}

}  // namespace margin_core
