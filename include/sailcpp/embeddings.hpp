#pragma once

#include "sailcpp/types.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sailcpp {

struct MultimodalInput {
  ContentType content_type = ContentType::kFigure;
  std::string text;
  std::vector<std::byte> image;
};

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual int dimensions() const = 0;
  virtual std::vector<float> EmbedText(const std::string& text) = 0;
  virtual std::vector<float> EmbedMultimodal(const MultimodalInput& input) = 0;
};

class BatchEmbeddingProvider : public EmbeddingProvider {
 public:
  ~BatchEmbeddingProvider() override = default;
  virtual std::vector<std::vector<float>> EmbedTextBatch(const std::vector<std::string>& texts) = 0;
};

// Signed feature hashing over lowercase alphanumeric tokens, L2 normalized.
// Deterministic and offline; multimodal inputs embed their description text.
class HashedTokenEmbedder final : public BatchEmbeddingProvider {
 public:
  explicit HashedTokenEmbedder(int dimensions = 256, std::size_t memoization_capacity = 4096);

  int dimensions() const override;
  std::vector<float> EmbedText(const std::string& text) override;
  std::vector<float> EmbedMultimodal(const MultimodalInput& input) override;
  std::vector<std::vector<float>> EmbedTextBatch(const std::vector<std::string>& texts) override;
  [[nodiscard]] std::size_t cache_size() const;

 private:
  int dimensions_;
  std::size_t memoization_capacity_ = 0;
  std::unordered_map<std::string, std::vector<float>> memoized_embeddings_{};
  std::deque<std::string> memoization_order_{};
  mutable std::mutex mutex_{};
};

}  // namespace sailcpp
