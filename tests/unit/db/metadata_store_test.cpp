#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <vector>

#include "margin_core/db/metadata_store.hpp"
#include "../../common/utilities_test.hpp"

namespace margin_core {

class MetadataStoreTest : public margin_tests::MetadataStoreTestBase {
 protected:
  void SetUp() override {
    MetadataStoreTestBase::SetUp();
    metadata_store_->upsert_notebook(margin_tests::TestUtilities::create_test_notebook("nb1", "Biology"));
  }
};

// Notebooks

TEST_F(MetadataStoreTest, UpsertNotebook_CreatesAndUpdatesTitle) {
  auto notebook = metadata_store_->get_notebook("nb1");
  ASSERT_TRUE(notebook.has_value());
  EXPECT_EQ(notebook->title, "Biology");

  metadata_store_->upsert_notebook(margin_tests::TestUtilities::create_test_notebook("nb1", "Cell Biology"));

  EXPECT_EQ(metadata_store_->get_notebook("nb1")->title, "Cell Biology");
  EXPECT_EQ(metadata_store_->list_notebooks().size(), 1u);
}

TEST_F(MetadataStoreTest, ClosedDatabase_RaisesMetadataStoreError) {
  db_manager_->shutdown();

  EXPECT_THROW(metadata_store_->list_notebooks(), MetadataStoreError);
  EXPECT_THROW(metadata_store_->get_source("s1"), MetadataStoreError);
}

TEST_F(MetadataStoreTest, GetNotebook_MissingIsNullopt) {
  EXPECT_FALSE(metadata_store_->get_notebook("nope").has_value());
}

TEST_F(MetadataStoreTest, CreatedAt_RoundTripsToTheSecond) {
  auto notebook = margin_tests::TestUtilities::create_test_notebook("nb2", "Chemistry");
  metadata_store_->upsert_notebook(notebook);

  auto stored = metadata_store_->get_notebook("nb2");
  ASSERT_TRUE(stored.has_value());
  auto expected = std::chrono::time_point_cast<std::chrono::seconds>(notebook.created_at);
  EXPECT_EQ(std::chrono::time_point_cast<std::chrono::seconds>(stored->created_at), expected);
}

TEST_F(MetadataStoreTest, ListNotebooks_ReturnsAll) {
  metadata_store_->upsert_notebook(margin_tests::TestUtilities::create_test_notebook("nb2", "Chemistry"));

  auto notebooks = metadata_store_->list_notebooks();
  ASSERT_EQ(notebooks.size(), 2u);
  auto titles = metadata_store_->notebook_titles();
  EXPECT_EQ(titles["nb1"], "Biology");
  EXPECT_EQ(titles["nb2"], "Chemistry");
}

TEST_F(MetadataStoreTest, DeleteNotebook_CascadesToSourcesAndChunks) {
  metadata_store_->upsert_source(margin_tests::TestUtilities::create_test_source("s1", "nb1", "Cells"));
  metadata_store_->replace_chunks("s1", margin_tests::TestUtilities::create_test_chunks("s1", {"a", "b"}));

  metadata_store_->delete_notebook("nb1");

  EXPECT_FALSE(metadata_store_->get_notebook("nb1").has_value());
  EXPECT_FALSE(metadata_store_->get_source("s1").has_value());
  EXPECT_TRUE(metadata_store_->get_chunks("s1").empty());
}

// Sources

TEST_F(MetadataStoreTest, UpsertSource_StoresAllFields) {
  metadata_store_->upsert_source(
      margin_tests::TestUtilities::create_test_source("s1", "nb1", "Mitochondria", "Powerhouse of the cell."));

  auto source = metadata_store_->get_source("s1");
  ASSERT_TRUE(source.has_value());
  EXPECT_EQ(source->notebook_id, "nb1");
  EXPECT_EQ(source->title, "Mitochondria");
  EXPECT_EQ(source->content, "Powerhouse of the cell.");
  EXPECT_EQ(source->content_hash, "hash_s1");
}

TEST_F(MetadataStoreTest, UpsertSource_UpdatesInPlace) {
  auto source = margin_tests::TestUtilities::create_test_source("s1", "nb1", "Draft", "v1");
  metadata_store_->upsert_source(source);
  source.title = "Final";
  source.content = "v2";
  source.content_hash = "hash_v2";
  metadata_store_->upsert_source(source);

  auto stored = metadata_store_->get_source("s1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->title, "Final");
  EXPECT_EQ(stored->content, "v2");
  EXPECT_EQ(stored->content_hash, "hash_v2");
  EXPECT_EQ(metadata_store_->list_sources("nb1").size(), 1u);
}

TEST_F(MetadataStoreTest, UpsertSource_UnknownNotebookThrows) {
  EXPECT_THROW(
      metadata_store_->upsert_source(margin_tests::TestUtilities::create_test_source("s1", "ghost", "Lost")),
      MetadataStoreError);
  EXPECT_FALSE(metadata_store_->get_source("s1").has_value());
}

TEST_F(MetadataStoreTest, ListSources_ScopedToNotebook) {
  metadata_store_->upsert_notebook(margin_tests::TestUtilities::create_test_notebook("nb2", "Chemistry"));
  metadata_store_->upsert_source(margin_tests::TestUtilities::create_test_source("s1", "nb1", "Cells"));
  metadata_store_->upsert_source(margin_tests::TestUtilities::create_test_source("s2", "nb1", "Tissues"));
  metadata_store_->upsert_source(margin_tests::TestUtilities::create_test_source("s3", "nb2", "Bonds"));

  EXPECT_EQ(metadata_store_->list_sources("nb1").size(), 2u);
  EXPECT_EQ(metadata_store_->list_sources("nb2").size(), 1u);
  EXPECT_TRUE(metadata_store_->list_sources("nb3").empty());

  auto nb1_titles = metadata_store_->source_titles("nb1");
  EXPECT_EQ(nb1_titles.size(), 2u);
  EXPECT_EQ(nb1_titles["s2"], "Tissues");
  EXPECT_EQ(metadata_store_->all_source_titles().size(), 3u);
}

TEST_F(MetadataStoreTest, DeleteSource_RemovesChunks) {
  metadata_store_->upsert_source(margin_tests::TestUtilities::create_test_source("s1", "nb1", "Cells"));
  metadata_store_->replace_chunks("s1", margin_tests::TestUtilities::create_test_chunks("s1", {"a"}));

  metadata_store_->delete_source("s1");

  EXPECT_FALSE(metadata_store_->get_source("s1").has_value());
  EXPECT_TRUE(metadata_store_->get_chunks("s1").empty());
  EXPECT_TRUE(metadata_store_->get_notebook("nb1").has_value());
}

// Chunks

TEST_F(MetadataStoreTest, ReplaceChunks_StoresInOrder) {
  metadata_store_->upsert_source(margin_tests::TestUtilities::create_test_source("s1", "nb1", "Cells"));
  std::vector<Chunk> chunks{margin_tests::TestUtilities::create_test_chunk("s1", 1, "second", 2),
                            margin_tests::TestUtilities::create_test_chunk("s1", 0, "first")};

  metadata_store_->replace_chunks("s1", chunks);

  auto stored = metadata_store_->get_chunks("s1");
  ASSERT_EQ(stored.size(), 2u);
  EXPECT_EQ(stored[0].text, "first");
  EXPECT_EQ(stored[0].id, "s1:0");
  EXPECT_FALSE(stored[0].page_number.has_value());
  EXPECT_EQ(stored[1].text, "second");
  EXPECT_EQ(stored[1].page_number, std::optional<int>(2));
}

TEST_F(MetadataStoreTest, ReplaceChunks_DropsPreviousChunks) {
  metadata_store_->upsert_source(margin_tests::TestUtilities::create_test_source("s1", "nb1", "Cells"));
  metadata_store_->replace_chunks("s1", margin_tests::TestUtilities::create_test_chunks("s1", {"a", "b", "c"}));
  metadata_store_->replace_chunks("s1", margin_tests::TestUtilities::create_test_chunks("s1", {"z"}));

  auto stored = metadata_store_->get_chunks("s1");
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].text, "z");

  metadata_store_->replace_chunks("s1", {});
  EXPECT_TRUE(metadata_store_->get_chunks("s1").empty());
}

TEST_F(MetadataStoreTest, ReplaceChunks_UnknownSourceThrows) {
  EXPECT_THROW(metadata_store_->replace_chunks("ghost", margin_tests::TestUtilities::create_test_chunks("ghost", {"x"})),
               MetadataStoreError);
}

}  // namespace margin_core
