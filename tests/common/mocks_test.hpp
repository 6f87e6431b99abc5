#pragma once

#include <gmock/gmock.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "margin_core/config/settings_store.hpp"
#include "margin_core/embeddings/embedding_provider.hpp"
#include "margin_core/embeddings/hash_embedding_provider.hpp"
#include "margin_core/embeddings/provider_factory.hpp"
#include "margin_core/embeddings/tiered_embedder.hpp"
#include "margin_core/llm/text_generator.hpp"
#include "margin_core/net/http_client.hpp"
#include "margin_core/retrieval/sufficiency_judge.hpp"
#include "margin_core/storage/shard_store.hpp"
#include "margin_core/storage/vector_store.hpp"

namespace margin_tests {

/**
 * Mock embedding provider. Tier is fixed at construction; availability and
 * results are set per test.
 */
class MockEmbeddingProvider : public margin_core::EmbeddingProvider {
 public:
  explicit MockEmbeddingProvider(margin_core::EmbeddingTier tier) : tier_(tier) {
    ON_CALL(*this, is_available()).WillByDefault(testing::Return(true));
  }

  margin_core::EmbeddingTier tier() const override {
    return tier_;
  }

  MOCK_METHOD(bool, is_available, (), (override));
  MOCK_METHOD(std::vector<margin_core::Embedding>, embed, (const std::vector<std::string>& texts), (override));

 private:
  margin_core::EmbeddingTier tier_;
};

class MockTextGenerator : public margin_core::TextGenerator {
 public:
  MOCK_METHOD(std::string, generate_text, (const std::string& prompt), (override));
};

class MockSufficiencyJudge : public margin_core::SufficiencyJudge {
 public:
  MOCK_METHOD(bool, is_sufficient, (const std::string& question, const std::string& context), (override));
};

class MockHttpClient : public margin_core::HttpClient {
 public:
  MOCK_METHOD(margin_core::HttpResponse,
              post_json,
              (const std::string& url,
               const std::string& body,
               const std::vector<std::string>& headers,
               long timeout_seconds),
              (override));
};

class MockShardStore : public margin_core::ShardStore {
 public:
  MOCK_METHOD(std::optional<margin_core::VectorShard>,
              get,
              (const std::string& notebook_id, const std::string& source_id),
              (override));
  MOCK_METHOD(void, put, (const std::string& notebook_id, const margin_core::VectorShard& shard), (override));
  MOCK_METHOD(bool, remove, (const std::string& notebook_id, const std::string& source_id), (override));
  MOCK_METHOD(bool, remove_notebook, (const std::string& notebook_id), (override));
  MOCK_METHOD(std::vector<std::string>, list_shards, (const std::string& notebook_id), (override));
  MOCK_METHOD(std::vector<std::string>, list_notebooks, (), (override));
};

/**
 * Vector store with scripted search results. The backing shard store is a
 * nice mock, so non-search calls are harmless no-ops.
 */
class MockVectorStore : public margin_core::VectorStore {
 public:
  MockVectorStore() : margin_core::VectorStore(std::make_shared<testing::NiceMock<MockShardStore>>()) {}

  MOCK_METHOD(std::vector<margin_core::SearchHit>,
              search,
              (const std::string& notebook_id,
               const margin_core::Embedding& query_vector,
               size_t limit,
               const std::optional<std::vector<std::string>>& source_filter,
               const std::optional<margin_core::EmbeddingTag>& query_tag),
              (override));
  MOCK_METHOD(std::vector<margin_core::SearchHit>,
              search_multiple,
              (const std::vector<std::string>& notebook_ids,
               const margin_core::Embedding& query_vector,
               size_t limit,
               const std::optional<margin_core::EmbeddingTag>& query_tag),
              (override));
};

class MockTieredEmbedder : public margin_core::TieredEmbedder {
 public:
  MockTieredEmbedder(std::shared_ptr<margin_core::SettingsStore> settings,
                     std::shared_ptr<margin_core::ProviderFactory> providers)
      : margin_core::TieredEmbedder(std::move(settings), std::move(providers)) {}

  MOCK_METHOD(margin_core::EmbeddingResult, embed_tagged, (const std::vector<std::string>& texts), (override));
  MOCK_METHOD(margin_core::EmbeddingTier, get_active_model, (), (override));
};

/**
 * Provider factory whose clients are injected by the test. Unset clients
 * fall back to the real factory methods, so the hash tier is always real.
 * Sleeps are recorded instead of performed.
 */
class FakeProviderFactory : public margin_core::ProviderFactory {
 public:
  explicit FakeProviderFactory(std::shared_ptr<margin_core::SettingsStore> settings)
      : margin_core::ProviderFactory(std::move(settings)) {}

  std::shared_ptr<margin_core::EmbeddingProvider> local;
  std::shared_ptr<margin_core::EmbeddingProvider> remote;
  std::shared_ptr<margin_core::TextGenerator> generator;
  std::shared_ptr<margin_core::HttpClient> http;

  int local_builds = 0;
  int remote_builds = 0;
  std::vector<std::chrono::milliseconds> sleeps;

 protected:
  std::shared_ptr<margin_core::EmbeddingProvider> create_local_provider(
      const margin_core::Settings& settings) override {
    ++local_builds;
    return local ? local : margin_core::ProviderFactory::create_local_provider(settings);
  }

  std::shared_ptr<margin_core::EmbeddingProvider> create_remote_provider(
      const margin_core::Settings& settings) override {
    ++remote_builds;
    return remote ? remote : margin_core::ProviderFactory::create_remote_provider(settings);
  }

  std::shared_ptr<margin_core::TextGenerator> create_text_generator(const margin_core::Settings&) override {
    return generator;
  }

  std::shared_ptr<margin_core::HttpClient> http_client() override {
    return http ? http : margin_core::ProviderFactory::http_client();
  }

  margin_core::Sleeper sleeper() override {
    return [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); };
  }
};

/**
 * Utility functions for creating test data in tests
 */
namespace MockUtilities {

// Provider that reports itself unavailable and must never be asked to embed
inline std::shared_ptr<testing::NiceMock<MockEmbeddingProvider>> unavailable_provider(
    margin_core::EmbeddingTier tier) {
  auto provider = std::make_shared<testing::NiceMock<MockEmbeddingProvider>>(tier);
  ON_CALL(*provider, is_available()).WillByDefault(testing::Return(false));
  EXPECT_CALL(*provider, embed(testing::_)).Times(0);
  return provider;
}

// One constant vector per input text
inline std::vector<margin_core::Embedding> constant_vectors(size_t count, size_t dimension, float value = 0.5f) {
  return std::vector<margin_core::Embedding>(count, margin_core::Embedding(dimension, value));
}

}  // namespace MockUtilities

}  // namespace margin_tests
