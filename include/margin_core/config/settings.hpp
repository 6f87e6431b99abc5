#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace margin_core {

// Raised when a provider is explicitly requested but cannot be configured,
// e.g. remote mode with no API key.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

enum class EmbeddingMode { Auto, Local, Remote };

enum class GenerationBackend { Ollama, Remote };

inline std::string to_string(EmbeddingMode mode) {
  switch (mode) {
    case EmbeddingMode::Auto:
      return "auto";
    case EmbeddingMode::Local:
      return "local";
    case EmbeddingMode::Remote:
      return "remote";
  }
  return "auto";
}

inline EmbeddingMode embedding_mode_from_string(const std::string& str) {
  if (str == "auto")
    return EmbeddingMode::Auto;
  if (str == "local")
    return EmbeddingMode::Local;
  if (str == "remote")
    return EmbeddingMode::Remote;
  throw std::runtime_error("Unknown embedding_mode: " + str);
}

inline GenerationBackend generation_backend_from_string(const std::string& str) {
  if (str == "ollama")
    return GenerationBackend::Ollama;
  if (str == "remote")
    return GenerationBackend::Remote;
  throw std::runtime_error("Unknown generation_backend: " + str);
}

struct Settings {
  std::string data_dir = "./data";

  EmbeddingMode embedding_mode = EmbeddingMode::Auto;
  std::string ollama_url = "http://localhost:11434";
  std::string local_embedding_model = "all-minilm";

  GenerationBackend generation_backend = GenerationBackend::Ollama;
  std::string generation_model = "llama3.2";

  // Remote (Gemini-compatible) provider
  std::string remote_api_key;
  std::string remote_endpoint = "https://generativelanguage.googleapis.com/v1beta";
  std::string remote_embedding_model = "text-embedding-004";
  std::string remote_generation_model = "gemini-2.0-flash";
  int remote_batch_size = 100;
  int remote_max_attempts = 3;
  int remote_base_delay_ms = 1000;
  int remote_timeout_seconds = 30;

  int hash_dimension = 768;

  // Chunking, in estimated tokens
  int chunk_size = 500;
  int chunk_overlap = 100;

  // Retrieval
  int standard_limit = 8;
  int subquery_limit = 6;
  int context_window = 8;
  int expanded_context_window = 12;
  int max_refinement_iterations = 1;
  int min_context_chars = 200;

  int recommendation_overfetch = 3;
  int recommendation_sample_chars = 2000;

  int db_pool_size = 2;

  bool operator==(const Settings&) const = default;

  std::filesystem::path vector_store_dir() const {
    return std::filesystem::path(data_dir) / "vector-store";
  }

  std::filesystem::path metadata_db_path() const {
    return std::filesystem::path(data_dir) / "metadata.db";
  }

  // Load settings from a JSON file at the given path
  static Settings from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct settings from a JSON object (useful for tests)
  static Settings from_json(const nlohmann::json& json_config) {
    Settings settings;

    settings.data_dir = json_config.value("data_dir", settings.data_dir);
    settings.embedding_mode =
        embedding_mode_from_string(json_config.value("embedding_mode", std::string("auto")));
    settings.ollama_url = json_config.value("ollama_url", settings.ollama_url);
    settings.local_embedding_model =
        json_config.value("local_embedding_model", settings.local_embedding_model);
    settings.generation_backend = generation_backend_from_string(
        json_config.value("generation_backend", std::string("ollama")));
    settings.generation_model = json_config.value("generation_model", settings.generation_model);

    settings.remote_api_key = json_config.value("remote_api_key", settings.remote_api_key);
    if (const char* env_key = std::getenv("MARGIN_API_KEY"); env_key != nullptr && *env_key != '\0') {
      settings.remote_api_key = env_key;
    }
    settings.remote_endpoint = json_config.value("remote_endpoint", settings.remote_endpoint);
    settings.remote_embedding_model =
        json_config.value("remote_embedding_model", settings.remote_embedding_model);
    settings.remote_generation_model =
        json_config.value("remote_generation_model", settings.remote_generation_model);

    settings.remote_batch_size = int_value(json_config, "remote_batch_size", settings.remote_batch_size);
    settings.remote_max_attempts =
        int_value(json_config, "remote_max_attempts", settings.remote_max_attempts);
    settings.remote_base_delay_ms =
        int_value(json_config, "remote_base_delay_ms", settings.remote_base_delay_ms);
    settings.remote_timeout_seconds =
        int_value(json_config, "remote_timeout_seconds", settings.remote_timeout_seconds);
    settings.hash_dimension = int_value(json_config, "hash_dimension", settings.hash_dimension);
    settings.chunk_size = int_value(json_config, "chunk_size", settings.chunk_size);
    settings.chunk_overlap = int_value(json_config, "chunk_overlap", settings.chunk_overlap);
    settings.standard_limit = int_value(json_config, "standard_limit", settings.standard_limit);
    settings.subquery_limit = int_value(json_config, "subquery_limit", settings.subquery_limit);
    settings.context_window = int_value(json_config, "context_window", settings.context_window);
    settings.expanded_context_window =
        int_value(json_config, "expanded_context_window", settings.expanded_context_window);
    settings.max_refinement_iterations =
        int_value(json_config, "max_refinement_iterations", settings.max_refinement_iterations);
    settings.min_context_chars = int_value(json_config, "min_context_chars", settings.min_context_chars);
    settings.recommendation_overfetch =
        int_value(json_config, "recommendation_overfetch", settings.recommendation_overfetch);
    settings.recommendation_sample_chars =
        int_value(json_config, "recommendation_sample_chars", settings.recommendation_sample_chars);
    settings.db_pool_size = int_value(json_config, "db_pool_size", settings.db_pool_size);

    settings.validate();
    return settings;
  }

  void validate() const {
    if (data_dir.empty()) {
      throw std::runtime_error("data_dir cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (local_embedding_model.empty() || remote_embedding_model.empty()) {
      throw std::runtime_error("embedding model names cannot be empty");
    }
    if (generation_model.empty() || remote_generation_model.empty()) {
      throw std::runtime_error("generation model names cannot be empty");
    }
    if (remote_batch_size < 1 || remote_batch_size > 100) {
      throw std::runtime_error("remote_batch_size must be between 1 and 100");
    }
    if (remote_max_attempts < 1) {
      throw std::runtime_error("remote_max_attempts must be at least 1");
    }
    if (remote_base_delay_ms < 0) {
      throw std::runtime_error("remote_base_delay_ms cannot be negative");
    }
    if (remote_timeout_seconds <= 0) {
      throw std::runtime_error("remote_timeout_seconds must be greater than 0");
    }
    if (hash_dimension <= 0) {
      throw std::runtime_error("hash_dimension must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be in [0, chunk_size)");
    }
    if (standard_limit <= 0 || subquery_limit <= 0 || context_window <= 0) {
      throw std::runtime_error("retrieval limits must be greater than 0");
    }
    if (expanded_context_window < context_window) {
      throw std::runtime_error("expanded_context_window cannot be smaller than context_window");
    }
    if (max_refinement_iterations < 0) {
      throw std::runtime_error("max_refinement_iterations cannot be negative");
    }
    if (min_context_chars < 0) {
      throw std::runtime_error("min_context_chars cannot be negative");
    }
    if (recommendation_overfetch < 1) {
      throw std::runtime_error("recommendation_overfetch must be at least 1");
    }
    if (recommendation_sample_chars <= 0) {
      throw std::runtime_error("recommendation_sample_chars must be greater than 0");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
  }

 private:
  // Falls back to the default if the key is missing or has the wrong type
  static int int_value(const nlohmann::json& json_config, const char* key, int default_value) {
    if (!json_config.contains(key)) {
      return default_value;
    }
    try {
      return json_config.at(key).get<int>();
    } catch (const std::exception&) {
      return default_value;
    }
  }
};

}  // namespace margin_core
