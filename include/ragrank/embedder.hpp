#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ragrank {

// Result of embedding computation
struct EmbeddingResult {
  std::vector<float> embedding;  // L2-normalised
  bool success = false;
  std::string error_message;
};

// Built-in ONNX encoders
enum class EmbedderModelType {
  kMiniLM,    // all-MiniLM-L6-v2 (384 dimensions)
  kBGESmall,  // BGE-small-en-v1.5 (384 dimensions)
  kBGELarge   // BGE-large-en-v1.5 (1024 dimensions)
};

// Query embedding function (text -> vector). Must be safe for concurrent
// Embed() calls. Dimension() must match the embeddings of indexed chunks.
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual EmbeddingResult Embed(std::string_view text) const = 0;

  virtual size_t Dimension() const = 0;

  virtual std::string ModelName() const = 0;
};

// Dimension of a built-in model type.
size_t EmbedderDimension(EmbedderModelType type);

// Load an ONNX encoder. vocab.txt must sit next to the model file.
// BGE models get the BGE query instruction prefix.
// num_threads: 0 = runtime default
// Returns nullptr on failure (or without RAGRANK_ENABLE_SEMANTIC), sets error_out
std::unique_ptr<Embedder> CreateOnnxEmbedder(const std::string& model_path,
                                             EmbedderModelType type,
                                             int num_threads = 0,
                                             std::string* error_out = nullptr);

}  // namespace ragrank
