#pragma once

#include <string>
#include <vector>

#include "margin_core/types/embedding.hpp"

namespace margin_core {

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// One strategy for turning text into a fixed-length vector.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual EmbeddingTier tier() const = 0;

  // Cheap readiness check. Providers reporting false are skipped by the tier chain.
  virtual bool is_available() = 0;

  // Returns exactly one vector per input text, in input order.
  virtual std::vector<Embedding> embed(const std::vector<std::string>& texts) = 0;
};

}  // namespace margin_core
