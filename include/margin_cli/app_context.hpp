#pragma once

#include <memory>

#include "margin_core/config/settings_store.hpp"
#include "margin_core/db/metadata_store.hpp"
#include "margin_core/embeddings/provider_factory.hpp"
#include "margin_core/embeddings/tiered_embedder.hpp"
#include "margin_core/retrieval/retrieval_orchestrator.hpp"
#include "margin_core/services/ingestion_service.hpp"
#include "margin_core/services/recommendation_service.hpp"
#include "margin_core/services/search_service.hpp"
#include "margin_core/storage/vector_store.hpp"

namespace margin_cli {

// Owns every core service, wired against one SettingsStore. Initializes the
// database singleton on construction and shuts it down on destruction.
struct AppContext {
    explicit AppContext(std::shared_ptr<margin_core::SettingsStore> settings_store);
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    std::shared_ptr<margin_core::SettingsStore> settings;
    std::shared_ptr<margin_core::ProviderFactory> providers;
    std::shared_ptr<margin_core::TieredEmbedder> embedder;
    std::shared_ptr<margin_core::VectorStore> vector_store;
    std::shared_ptr<margin_core::MetadataStore> metadata_store;
    std::shared_ptr<margin_core::IngestionService> ingestion;
    std::shared_ptr<margin_core::RetrievalOrchestrator> retrieval;
    std::shared_ptr<margin_core::RecommendationService> recommendations;
    std::shared_ptr<margin_core::SearchService> search;
};

}  // namespace margin_cli
