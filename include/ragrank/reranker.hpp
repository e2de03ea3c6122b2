#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ragrank {

/**
 * Result of scoring one (query, passage) pair.
 */
struct ScoringResult {
  bool success = false;
  float score = 0.0f;  // relevance, higher = more relevant
  std::string error_message;
};

/**
 * Cross-encoder scoring function: rates a (query, passage) pair jointly.
 * Implementations must be safe for concurrent calls.
 */
class CrossEncoder {
 public:
  virtual ~CrossEncoder() = default;

  virtual ScoringResult Score(std::string_view query,
                              std::string_view passage) const = 0;

  /** One result per passage, in input order. */
  virtual std::vector<ScoringResult> ScoreBatch(
      std::string_view query,
      const std::vector<std::string_view>& passages) const = 0;

  /** Maximum tokens per pair. */
  virtual size_t MaxTextLength() const = 0;

  virtual std::string ModelType() const = 0;
};

/**
 * BGE reranker (BAAI bge-reranker-base / -large) on ONNX Runtime.
 *
 * Pairs are encoded as [CLS] query [SEP] passage [SEP] with WordPiece and
 * scored in padded batches; the logit is mapped through a sigmoid to [0, 1].
 */
class BGECrossEncoder : public CrossEncoder {
 public:
  /**
   * @param num_threads Number of threads for ONNX inference (0 = runtime default)
   * @param batch_size Pairs per inference call
   */
  explicit BGECrossEncoder(int num_threads = 0, size_t batch_size = 16);

  ~BGECrossEncoder();

  /**
   * @param model_path Path to ONNX model file
   * @param vocab_path Path to vocab.txt (empty = next to the model)
   * @param error_out Error message output
   * @return true if initialization successful
   */
  bool Initialize(const std::string& model_path,
                  const std::string& vocab_path,
                  std::string* error_out);

  ScoringResult Score(std::string_view query,
                      std::string_view passage) const override;

  std::vector<ScoringResult> ScoreBatch(
      std::string_view query,
      const std::vector<std::string_view>& passages) const override;

  size_t MaxTextLength() const override { return max_length_; }

  std::string ModelType() const override { return "bge-reranker"; }

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
  size_t max_length_ = 512;
};

/**
 * Load a cross-encoder from an ONNX file (vocab.txt next to it).
 * Returns nullptr with error_out set on failure or without
 * RAGRANK_ENABLE_SEMANTIC.
 */
std::unique_ptr<CrossEncoder> CreateCrossEncoder(const std::string& model_path,
                                                 int num_threads = 0,
                                                 std::string* error_out = nullptr);

struct RerankCandidate {
  std::string chunk_id;
  std::string text;
};

struct RerankResult {
  std::string chunk_id;
  double score = 0.0;        // cross-encoder score (0 when not applied)
  size_t original_rank = 0;  // 1-based position in the input
  size_t final_rank = 0;     // 1-based position in the output
};

struct RerankerOptions {
  // Results kept when the caller passes top_k == 0
  size_t default_top_k = 10;

  // Drop scored results below this (only when scores were applied)
  std::optional<double> min_score;
};

/**
 * Reorders an existing candidate set with a cross-encoder.
 *
 * The model handle may be null, meaning "unavailable": Rerank() then
 * returns the input order. Any scoring failure falls back the same way.
 * Output ids always come from the input; duplicates keep their first
 * occurrence. Equal scores keep input order.
 */
class Reranker {
 public:
  explicit Reranker(std::shared_ptr<const CrossEncoder> model,
                    const RerankerOptions& opt = RerankerOptions{});

  bool Available() const { return model_ != nullptr; }

  /**
   * @param applied Set to whether cross-encoder scores decided the order
   * @param error_out Set to the reason when scores were not applied
   */
  std::vector<RerankResult> Rerank(std::string_view query,
                                   const std::vector<RerankCandidate>& candidates,
                                   size_t top_k,
                                   bool* applied = nullptr,
                                   std::string* error_out = nullptr) const;

 private:
  std::shared_ptr<const CrossEncoder> model_;
  RerankerOptions opt_;
};

}  // namespace ragrank
