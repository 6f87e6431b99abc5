#include "margin_core/llm/ollama_client_lock.hpp"

namespace margin_core {

std::mutex& ollama_client_mutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace margin_core
