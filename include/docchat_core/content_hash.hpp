#pragma once

#include <string>

namespace docchat_core {

// Hex-encoded SHA-256 of the given bytes.
std::string sha256_hex(const std::string &content);

}  // namespace docchat_core
