#pragma once

#include <mutex>

namespace margin_core {

// ollama-hpp talks through one process-wide client whose server URL is global
// state. Every call into it, from any provider or generator instance, holds
// this lock.
std::mutex& ollama_client_mutex();

}  // namespace margin_core
