#include <ragrank/reranker.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_set>

#ifdef RAGRANK_ENABLE_SEMANTIC
#include <ragrank/onnx_session.hpp>
#include <ragrank/tokenizer.hpp>
#endif

namespace ragrank {

#ifdef RAGRANK_ENABLE_SEMANTIC

class BGECrossEncoder::Impl {
 public:
  Impl(int num_threads, size_t batch_size)
      : num_threads_(num_threads),
        batch_size_(std::max<size_t>(batch_size, 1)),
        session_("ragrank_cross_encoder") {}

  bool Initialize(const std::string& model_path,
                  const std::string& vocab_path_in,
                  std::string* error_out) {
    std::string vocab_path = vocab_path_in;
    if (vocab_path.empty()) {
      vocab_path = internal::FindSiblingFile(model_path, "vocab.txt");
      if (vocab_path.empty()) {
        if (error_out) {
          *error_out = internal::FindSiblingFile(model_path, "tokenizer.json").empty()
                           ? "Could not find vocab.txt in model directory"
                           : "SentencePiece tokenizers are not supported; use a "
                             "WordPiece model such as bge-reranker-base";
        }
        return false;
      }
    }

    tokenizer_ = internal::WordPieceTokenizer::Create(vocab_path, error_out);
    if (!tokenizer_) return false;
    return session_.Load(model_path, num_threads_, error_out);
  }

  std::vector<ScoringResult> ScoreBatch(std::string_view query,
                                        const std::vector<std::string_view>& passages,
                                        size_t max_length) const {
    std::vector<ScoringResult> results(passages.size());

    for (size_t begin = 0; begin < passages.size(); begin += batch_size_) {
      const size_t end = std::min(passages.size(), begin + batch_size_);

      std::vector<internal::TokenizerResult> rows;
      rows.reserve(end - begin);
      for (size_t i = begin; i < end; ++i) {
        rows.push_back(tokenizer_->TokenizePair(query, passages[i], max_length));
      }
      internal::OnnxBatch batch = internal::PackBatch(rows, tokenizer_->PadTokenId());

      std::string error;
      auto outputs = session_.Run(&batch, &error);
      if (outputs.empty()) {
        for (size_t i = begin; i < end; ++i) results[i].error_message = error;
        continue;
      }

      const size_t count = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
      const size_t rows_in_batch = end - begin;
      if (count < rows_in_batch) {
        for (size_t i = begin; i < end; ++i) {
          results[i].error_message = "Unexpected output tensor shape";
        }
        continue;
      }
      // [batch] or [batch, labels]: first logit per row
      const size_t stride = count / rows_in_batch;
      const float* logits = outputs[0].GetTensorData<float>();
      for (size_t r = 0; r < rows_in_batch; ++r) {
        ScoringResult& out = results[begin + r];
        out.score = 1.0f / (1.0f + std::exp(-logits[r * stride]));
        out.success = true;
      }
    }
    return results;
  }

 private:
  int num_threads_;
  size_t batch_size_;
  std::unique_ptr<internal::WordPieceTokenizer> tokenizer_;
  internal::OnnxSession session_;
};

#else  // !RAGRANK_ENABLE_SEMANTIC

class BGECrossEncoder::Impl {
 public:
  Impl(int, size_t) {}

  bool Initialize(const std::string&, const std::string&, std::string* error_out) {
    if (error_out) {
      *error_out = "Cross-encoder requires RAGRANK_ENABLE_SEMANTIC=ON";
    }
    return false;
  }

  std::vector<ScoringResult> ScoreBatch(std::string_view,
                                        const std::vector<std::string_view>& passages,
                                        size_t) const {
    return std::vector<ScoringResult>(
        passages.size(), ScoringResult{false, 0.0f, "Semantic features disabled"});
  }
};

#endif  // RAGRANK_ENABLE_SEMANTIC

BGECrossEncoder::BGECrossEncoder(int num_threads, size_t batch_size)
    : impl_(std::make_unique<Impl>(num_threads, batch_size)) {}

BGECrossEncoder::~BGECrossEncoder() = default;

bool BGECrossEncoder::Initialize(const std::string& model_path,
                                 const std::string& vocab_path,
                                 std::string* error_out) {
  return impl_->Initialize(model_path, vocab_path, error_out);
}

ScoringResult BGECrossEncoder::Score(std::string_view query,
                                     std::string_view passage) const {
  return impl_->ScoreBatch(query, {passage}, max_length_).front();
}

std::vector<ScoringResult> BGECrossEncoder::ScoreBatch(
    std::string_view query,
    const std::vector<std::string_view>& passages) const {
  return impl_->ScoreBatch(query, passages, max_length_);
}

std::unique_ptr<CrossEncoder> CreateCrossEncoder(const std::string& model_path,
                                                 int num_threads,
                                                 std::string* error_out) {
  auto model = std::make_unique<BGECrossEncoder>(num_threads);
  if (!model->Initialize(model_path, "", error_out)) {
    return nullptr;
  }
  return model;
}

// ---------------------------------------------------------------------------
// Reranker
// ---------------------------------------------------------------------------

Reranker::Reranker(std::shared_ptr<const CrossEncoder> model, const RerankerOptions& opt)
    : model_(std::move(model)), opt_(opt) {}

std::vector<RerankResult> Reranker::Rerank(std::string_view query,
                                           const std::vector<RerankCandidate>& candidates,
                                           size_t top_k,
                                           bool* applied,
                                           std::string* error_out) const {
  if (applied) *applied = false;
  const size_t limit = top_k > 0 ? top_k : opt_.default_top_k;

  std::vector<RerankResult> results;
  std::vector<std::string_view> passages;
  std::unordered_set<std::string_view> seen;
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (!seen.insert(candidates[i].chunk_id).second) continue;
    results.push_back(RerankResult{candidates[i].chunk_id, 0.0, i + 1, 0});
    passages.push_back(candidates[i].text);
  }

  auto finish = [limit](std::vector<RerankResult> out) {
    if (out.size() > limit) out.resize(limit);
    for (size_t i = 0; i < out.size(); ++i) out[i].final_rank = i + 1;
    return out;
  };
  auto fallback = [&](const std::string& reason) {
    if (error_out) *error_out = reason;
    for (auto& r : results) r.score = 0.0;
    return finish(std::move(results));
  };

  if (results.empty()) return results;
  if (!model_) return fallback("no cross-encoder loaded");

  std::vector<ScoringResult> scores = model_->ScoreBatch(query, passages);
  if (scores.size() != results.size()) {
    return fallback("cross-encoder returned " + std::to_string(scores.size()) +
                    " scores for " + std::to_string(results.size()) + " candidates");
  }
  for (size_t i = 0; i < scores.size(); ++i) {
    if (!scores[i].success) return fallback(scores[i].error_message);
    if (!std::isfinite(scores[i].score)) return fallback("non-finite cross-encoder score");
    results[i].score = scores[i].score;
  }

  std::stable_sort(results.begin(), results.end(),
                   [](const RerankResult& a, const RerankResult& b) {
                     return a.score > b.score;
                   });
  if (opt_.min_score) {
    const double min_score = *opt_.min_score;
    results.erase(std::remove_if(results.begin(), results.end(),
                                 [min_score](const RerankResult& r) {
                                   return r.score < min_score;
                                 }),
                  results.end());
  }

  if (applied) *applied = true;
  return finish(std::move(results));
}

}  // namespace ragrank
