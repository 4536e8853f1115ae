#pragma once

#include <exception>
#include <string>

namespace docchat_core {

class DocchatError : public std::exception {
 public:
  explicit DocchatError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Bad chunking parameters or an invalid configuration value.
class ConfigurationError : public DocchatError {
 public:
  using DocchatError::DocchatError;
};

// A vector whose length differs from the store's fixed dimensionality.
// Usually means the embedding model changed under a live index.
class DimensionMismatchError : public DocchatError {
 public:
  using DocchatError::DocchatError;
};

class EmbeddingProviderError : public DocchatError {
 public:
  using DocchatError::DocchatError;
};

class GenerationProviderError : public DocchatError {
 public:
  using DocchatError::DocchatError;
};

class InvalidArgumentError : public DocchatError {
 public:
  using DocchatError::DocchatError;
};

class NotFoundError : public DocchatError {
 public:
  using DocchatError::DocchatError;
};

}  // namespace docchat_core
