#pragma once

#include <stdexcept>
#include <string>

namespace margin_core {

class HashingError : public std::exception {
 public:
  explicit HashingError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Lowercase hex SHA-256 of the given bytes.
std::string sha256_hex(const std::string& content);

}  // namespace margin_core
