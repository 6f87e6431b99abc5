#include "margin_cli/app_context.hpp"

#include "margin_core/db/database_manager.hpp"
#include "margin_core/storage/file_shard_store.hpp"

namespace margin_cli {

using namespace margin_core;

AppContext::AppContext(std::shared_ptr<SettingsStore> settings_store)
    : settings(std::move(settings_store)) {
    const Settings current = settings->current();

    auto& db_manager = DatabaseManager::get_instance();
    db_manager.initialize(current.metadata_db_path(), current.db_pool_size);

    providers = std::make_shared<ProviderFactory>(settings);
    embedder = std::make_shared<TieredEmbedder>(settings, providers);
    vector_store = std::make_shared<VectorStore>(std::make_shared<FileShardStore>(current.vector_store_dir()));
    metadata_store = std::make_shared<MetadataStore>(db_manager);

    ingestion = std::make_shared<IngestionService>(settings, metadata_store, embedder, vector_store);
    retrieval = std::make_shared<RetrievalOrchestrator>(settings, embedder, vector_store, providers, metadata_store);
    recommendations = std::make_shared<RecommendationService>(settings, metadata_store, embedder, vector_store);
    search = std::make_shared<SearchService>(metadata_store, embedder, vector_store);
}

AppContext::~AppContext() {
    DatabaseManager::get_instance().shutdown();
}

}  // namespace margin_cli
