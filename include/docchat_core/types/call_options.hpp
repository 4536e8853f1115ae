#pragma once

#include <chrono>
#include <string>

namespace docchat_core {

// Per-call settings for every request that leaves the process.
// Credentials travel with the call and are never read from global state.
struct CallOptions {
  std::string api_key;
  std::chrono::milliseconds timeout{std::chrono::seconds(60)};
};

}  // namespace docchat_core
