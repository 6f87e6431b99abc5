#pragma once

#include <string>

namespace margin_core {

class TextGenerationError : public std::exception {
 public:
  explicit TextGenerationError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Prompt in, completion out. Used for sub-query planning and sufficiency checks.
class TextGenerator {
 public:
  virtual ~TextGenerator() = default;
  virtual std::string generate_text(const std::string& prompt) = 0;
};

}  // namespace margin_core
