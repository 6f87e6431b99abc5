#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "margin_core/services/ingestion_service.hpp"
#include "margin_core/util/hashing.hpp"
#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"

namespace margin_core {

using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

// Embeds every text to the same 4-dimensional vector under the given tier
auto constant_embedding(EmbeddingTier tier) {
  return [tier](const std::vector<std::string>& texts) {
    return EmbeddingResult{tier, margin_tests::MockUtilities::constant_vectors(texts.size(), 4)};
  };
}

}  // namespace

class IngestionServiceTest : public margin_tests::MetadataStoreTestBase {
 protected:
  void SetUp() override {
    MetadataStoreTestBase::SetUp();
    store_dir_ = margin_tests::TestUtilities::create_temp_dir("ingestion");

    Settings settings;
    settings.chunk_size = 10;
    settings.chunk_overlap = 2;
    settings.hash_dimension = 32;
    settings_ = std::make_shared<SettingsStore>(settings);
    providers_ = std::make_shared<margin_tests::FakeProviderFactory>(settings_);
    providers_->local = margin_tests::MockUtilities::unavailable_provider(EmbeddingTier::Local);
    providers_->remote = margin_tests::MockUtilities::unavailable_provider(EmbeddingTier::Remote);
    embedder_ = std::make_shared<TieredEmbedder>(settings_, providers_);
    vector_store_ = std::make_shared<VectorStore>(std::make_shared<FileShardStore>(store_dir_));
    service_ = std::make_unique<IngestionService>(settings_, metadata_store_, embedder_, vector_store_);

    metadata_store_->upsert_notebook(margin_tests::TestUtilities::create_test_notebook("nb1", "Notebook One"));
  }

  void TearDown() override {
    service_.reset();
    vector_store_.reset();
    margin_tests::TestUtilities::cleanup_temp_dir(store_dir_);
    MetadataStoreTestBase::TearDown();
  }

  static IngestRequest request(const std::string& text, bool force = false) {
    IngestRequest req;
    req.notebook_id = "nb1";
    req.source_id = "src1";
    req.title = "Field Notes";
    req.text = text;
    req.force = force;
    return req;
  }

  std::unique_ptr<IngestionService> service_with(std::shared_ptr<TieredEmbedder> embedder) {
    return std::make_unique<IngestionService>(settings_, metadata_store_, std::move(embedder), vector_store_);
  }

  const std::string text_ =
      "The river floods every spring. Farmers plant after the water recedes. "
      "Silt makes the fields rich. Harvest comes in late autumn.";

  std::filesystem::path store_dir_;
  std::shared_ptr<SettingsStore> settings_;
  std::shared_ptr<margin_tests::FakeProviderFactory> providers_;
  std::shared_ptr<TieredEmbedder> embedder_;
  std::shared_ptr<VectorStore> vector_store_;
  std::unique_ptr<IngestionService> service_;
};

TEST_F(IngestionServiceTest, IngestWritesMetadataChunksAndVectors) {
  IngestResult result = service_->ingest_source(request(text_));

  EXPECT_EQ(result.source_id, "src1");
  EXPECT_FALSE(result.skipped);
  EXPECT_GT(result.chunk_count, 1u);
  EXPECT_EQ(result.embedded_count, result.chunk_count);
  ASSERT_TRUE(result.tier.has_value());
  EXPECT_EQ(*result.tier, EmbeddingTier::Hash);

  auto source = metadata_store_->get_source("src1");
  ASSERT_TRUE(source.has_value());
  EXPECT_EQ(source->title, "Field Notes");
  EXPECT_EQ(source->content_hash, sha256_hex(text_));
  EXPECT_EQ(metadata_store_->get_chunks("src1").size(), result.chunk_count);

  auto tag = vector_store_->source_tag("nb1", "src1");
  ASSERT_TRUE(tag.has_value());
  EXPECT_EQ(tag->tier, EmbeddingTier::Hash);
  EXPECT_EQ(tag->dimension, 32u);
  EXPECT_FALSE(vector_store_->search("nb1", embedder_->embed_query("river floods"), 3).empty());
}

TEST_F(IngestionServiceTest, UnchangedContentIsSkipped) {
  IngestResult first = service_->ingest_source(request(text_));
  IngestResult second = service_->ingest_source(request(text_));

  EXPECT_TRUE(second.skipped);
  EXPECT_EQ(second.chunk_count, first.chunk_count);
  EXPECT_EQ(second.embedded_count, 0u);
  ASSERT_TRUE(second.tier.has_value());
  EXPECT_EQ(*second.tier, EmbeddingTier::Hash);
}

TEST_F(IngestionServiceTest, ForceReindexesUnchangedContent) {
  service_->ingest_source(request(text_));
  IngestResult forced = service_->ingest_source(request(text_, true));

  EXPECT_FALSE(forced.skipped);
  EXPECT_EQ(forced.embedded_count, forced.chunk_count);
}

TEST_F(IngestionServiceTest, MissingShardIsRebuilt) {
  service_->ingest_source(request(text_));
  vector_store_->delete_source("nb1", "src1");

  IngestResult again = service_->ingest_source(request(text_));

  EXPECT_FALSE(again.skipped);
  EXPECT_TRUE(vector_store_->has_source("nb1", "src1"));
}

TEST_F(IngestionServiceTest, MovingSourceToAnotherNotebookDropsOldVectors) {
  metadata_store_->upsert_notebook(margin_tests::TestUtilities::create_test_notebook("nb2", "Notebook Two"));
  service_->ingest_source(request(text_));
  ASSERT_TRUE(vector_store_->has_source("nb1", "src1"));

  IngestRequest moved = request(text_);
  moved.notebook_id = "nb2";
  IngestResult result = service_->ingest_source(moved);

  EXPECT_FALSE(result.skipped);
  EXPECT_FALSE(vector_store_->has_source("nb1", "src1"));
  EXPECT_TRUE(vector_store_->has_source("nb2", "src1"));
  EXPECT_TRUE(vector_store_->search("nb1", embedder_->embed_query("river floods"), 3).empty());
  EXPECT_EQ(metadata_store_->get_source("src1")->notebook_id, "nb2");
}

TEST_F(IngestionServiceTest, ChangedContentReplacesChunks) {
  service_->ingest_source(request(text_));
  IngestResult result = service_->ingest_source(request("A single short line."));

  EXPECT_FALSE(result.skipped);
  EXPECT_EQ(result.chunk_count, 1u);
  auto chunks = metadata_store_->get_chunks("src1");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text, "A single short line.");
}

TEST_F(IngestionServiceTest, BlankTextIsRejected) {
  try {
    service_->ingest_source(request("  \n\t "));
    FAIL() << "Expected IngestionError";
  } catch (const IngestionError& e) {
    EXPECT_STREQ(e.what(), "No text could be extracted from this source.");
  }
  EXPECT_FALSE(metadata_store_->get_source("src1").has_value());
}

TEST_F(IngestionServiceTest, RejectsMissingNotebookAndEmptyId) {
  IngestRequest unknown = request(text_);
  unknown.notebook_id = "ghost";
  EXPECT_THROW(service_->ingest_source(unknown), IngestionError);

  IngestRequest anonymous = request(text_);
  anonymous.source_id = "";
  EXPECT_THROW(service_->ingest_source(anonymous), IngestionError);
}

TEST_F(IngestionServiceTest, BlankTitleGetsPlaceholder) {
  IngestRequest req = request(text_);
  req.title = " ";
  service_->ingest_source(req);

  EXPECT_EQ(metadata_store_->get_source("src1")->title, "Untitled source");
}

TEST_F(IngestionServiceTest, PageBreaksReachChunks) {
  IngestRequest req = request("The first page holds one long opening sentence. Page two.");
  req.page_breaks = {48};
  service_->ingest_source(req);

  auto chunks = metadata_store_->get_chunks("src1");
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].page_number, std::optional<int>(1));
  EXPECT_EQ(chunks[1].page_number, std::optional<int>(2));
}

TEST_F(IngestionServiceTest, EmbeddingFailureDropsStaleVectors) {
  service_->ingest_source(request(text_));
  ASSERT_TRUE(vector_store_->has_source("nb1", "src1"));

  auto failing = std::make_shared<NiceMock<margin_tests::MockTieredEmbedder>>(settings_, providers_);
  ON_CALL(*failing, embed_tagged(_)).WillByDefault(Throw(std::runtime_error("out of memory")));
  auto service = service_with(failing);

  IngestResult result = service->ingest_source(request("Completely different content."));

  EXPECT_EQ(result.chunk_count, 1u);
  EXPECT_EQ(result.embedded_count, 0u);
  EXPECT_FALSE(result.tier.has_value());
  EXPECT_FALSE(vector_store_->has_source("nb1", "src1"));
  EXPECT_EQ(metadata_store_->get_source("src1")->content, "Completely different content.");
}

TEST_F(IngestionServiceTest, WrongVectorCountStoresNoVectors) {
  auto short_changed = std::make_shared<NiceMock<margin_tests::MockTieredEmbedder>>(settings_, providers_);
  ON_CALL(*short_changed, embed_tagged(_))
      .WillByDefault(Return(EmbeddingResult{EmbeddingTier::Local, {}}));

  IngestResult result = service_with(short_changed)->ingest_source(request(text_));

  EXPECT_EQ(result.embedded_count, 0u);
  EXPECT_FALSE(vector_store_->has_source("nb1", "src1"));
}

TEST_F(IngestionServiceTest, StaleSourcesFollowActiveTier) {
  auto embedder = std::make_shared<NiceMock<margin_tests::MockTieredEmbedder>>(settings_, providers_);
  ON_CALL(*embedder, embed_tagged(_)).WillByDefault(Invoke(constant_embedding(EmbeddingTier::Local)));
  ON_CALL(*embedder, get_active_model()).WillByDefault(Return(EmbeddingTier::Local));
  auto service = service_with(embedder);

  service->ingest_source(request(text_));
  metadata_store_->upsert_source(margin_tests::TestUtilities::create_test_source("src2", "nb1", "Unindexed"));
  EXPECT_EQ(service->stale_sources("nb1"), (std::vector<std::string>{"src2"}));

  ON_CALL(*embedder, get_active_model()).WillByDefault(Return(EmbeddingTier::Hash));
  ON_CALL(*embedder, embed_tagged(_)).WillByDefault(Invoke(constant_embedding(EmbeddingTier::Hash)));
  auto stale = service->stale_sources("nb1");
  EXPECT_EQ(stale.size(), 2u);
}

TEST_F(IngestionServiceTest, ReembedNotebookMigratesStaleShards) {
  auto embedder = std::make_shared<NiceMock<margin_tests::MockTieredEmbedder>>(settings_, providers_);
  ON_CALL(*embedder, embed_tagged(_)).WillByDefault(Invoke(constant_embedding(EmbeddingTier::Local)));
  ON_CALL(*embedder, get_active_model()).WillByDefault(Return(EmbeddingTier::Local));
  auto service = service_with(embedder);
  IngestResult original = service->ingest_source(request(text_));

  ON_CALL(*embedder, get_active_model()).WillByDefault(Return(EmbeddingTier::Hash));
  ON_CALL(*embedder, embed_tagged(_)).WillByDefault(Invoke(constant_embedding(EmbeddingTier::Hash)));
  auto results = service->reembed_notebook("nb1");

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk_count, original.chunk_count);
  ASSERT_TRUE(results[0].tier.has_value());
  EXPECT_EQ(*results[0].tier, EmbeddingTier::Hash);
  EXPECT_EQ(vector_store_->source_tag("nb1", "src1")->tier, EmbeddingTier::Hash);
  EXPECT_TRUE(service->stale_sources("nb1").empty());
}

TEST_F(IngestionServiceTest, ReembedUnknownSourceThrows) {
  EXPECT_THROW(service_->reembed_source("nb1", "nope"), IngestionError);
}

TEST_F(IngestionServiceTest, DeleteSourceRemovesEverything) {
  service_->ingest_source(request(text_));
  service_->delete_source("nb1", "src1");

  EXPECT_FALSE(metadata_store_->get_source("src1").has_value());
  EXPECT_TRUE(metadata_store_->get_chunks("src1").empty());
  EXPECT_FALSE(vector_store_->has_source("nb1", "src1"));
}

TEST_F(IngestionServiceTest, DeleteNotebookRemovesEverything) {
  service_->ingest_source(request(text_));
  service_->delete_notebook("nb1");

  EXPECT_FALSE(metadata_store_->get_notebook("nb1").has_value());
  EXPECT_FALSE(metadata_store_->get_source("src1").has_value());
  EXPECT_TRUE(vector_store_->list_sources("nb1").empty());
}

}  // namespace margin_core
