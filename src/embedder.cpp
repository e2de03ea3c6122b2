#include <ragrank/embedder.hpp>

#ifdef RAGRANK_ENABLE_SEMANTIC
#include <ragrank/onnx_session.hpp>
#include <ragrank/tokenizer.hpp>

#include <cmath>
#endif

namespace ragrank {

size_t EmbedderDimension(EmbedderModelType type) {
  switch (type) {
    case EmbedderModelType::kMiniLM:
    case EmbedderModelType::kBGESmall:
      return 384;
    case EmbedderModelType::kBGELarge:
      return 1024;
  }
  return 0;
}

#ifdef RAGRANK_ENABLE_SEMANTIC

namespace {

class OnnxEmbedder : public Embedder {
 public:
  explicit OnnxEmbedder(EmbedderModelType type)
      : type_(type), dimension_(EmbedderDimension(type)), session_("ragrank_embedder") {}

  bool Initialize(const std::string& model_path, const std::string& vocab_path,
                  int num_threads, std::string* error_out) {
    tokenizer_ = internal::WordPieceTokenizer::Create(vocab_path, error_out);
    if (!tokenizer_) return false;
    return session_.Load(model_path, num_threads, error_out);
  }

  EmbeddingResult Embed(std::string_view text) const override {
    EmbeddingResult result;

    // BGE query instruction, see https://huggingface.co/BAAI/bge-small-en-v1.5
    std::string input;
    if (type_ == EmbedderModelType::kBGESmall || type_ == EmbedderModelType::kBGELarge) {
      input = "Represent this sentence for searching relevant passages: ";
    }
    input.append(text);

    internal::TokenizerResult tokens = tokenizer_->Tokenize(input, 512);
    if (!tokens.success) {
      result.error_message = "Tokenization failed: " + tokens.error_message;
      return result;
    }
    internal::OnnxBatch batch = internal::PackBatch({tokens}, tokenizer_->PadTokenId());

    std::string error;
    auto outputs = session_.Run(&batch, &error);
    if (outputs.empty()) {
      result.error_message = error;
      return result;
    }

    auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
    const float* data = outputs[0].GetTensorData<float>();

    if (shape.size() == 3) {
      // [1, seq_len, hidden]: mean pooling over attended tokens
      const int64_t seq_len = shape[1];
      const int64_t hidden = shape[2];
      result.embedding.assign(static_cast<size_t>(hidden), 0.0f);
      int64_t attended = 0;
      for (int64_t i = 0; i < seq_len && i < batch.seq_len; ++i) {
        if (!batch.attention_mask[static_cast<size_t>(i)]) continue;
        ++attended;
        for (int64_t j = 0; j < hidden; ++j) {
          result.embedding[static_cast<size_t>(j)] += data[i * hidden + j];
        }
      }
      if (attended > 0) {
        for (float& v : result.embedding) v /= static_cast<float>(attended);
      }
    } else if (shape.size() == 2) {
      result.embedding.assign(data, data + shape[1]);
    } else {
      result.error_message = "Unexpected output tensor shape";
      return result;
    }

    if (dimension_ != 0 && result.embedding.size() != dimension_) {
      result.error_message = "Model produced " + std::to_string(result.embedding.size()) +
                             " dimensions, expected " + std::to_string(dimension_);
      return result;
    }

    double norm = 0.0;
    for (float v : result.embedding) norm += static_cast<double>(v) * v;
    norm = std::sqrt(norm);
    if (norm > 1e-12) {
      for (float& v : result.embedding) v = static_cast<float>(v / norm);
    }

    result.success = true;
    return result;
  }

  size_t Dimension() const override { return dimension_; }

  std::string ModelName() const override {
    switch (type_) {
      case EmbedderModelType::kMiniLM:
        return "all-MiniLM-L6-v2";
      case EmbedderModelType::kBGESmall:
        return "bge-small-en-v1.5";
      case EmbedderModelType::kBGELarge:
        return "bge-large-en-v1.5";
    }
    return "unknown";
  }

 private:
  EmbedderModelType type_;
  size_t dimension_;
  std::unique_ptr<internal::WordPieceTokenizer> tokenizer_;
  internal::OnnxSession session_;
};

}  // namespace

std::unique_ptr<Embedder> CreateOnnxEmbedder(const std::string& model_path,
                                             EmbedderModelType type,
                                             int num_threads,
                                             std::string* error_out) {
  const std::string vocab_path = internal::FindSiblingFile(model_path, "vocab.txt");
  if (vocab_path.empty()) {
    if (error_out) {
      *error_out = "Could not find vocab.txt in the same directory as " + model_path;
    }
    return nullptr;
  }

  auto embedder = std::make_unique<OnnxEmbedder>(type);
  if (!embedder->Initialize(model_path, vocab_path, num_threads, error_out)) {
    return nullptr;
  }
  return embedder;
}

#else  // !RAGRANK_ENABLE_SEMANTIC

std::unique_ptr<Embedder> CreateOnnxEmbedder(const std::string&, EmbedderModelType, int,
                                             std::string* error_out) {
  if (error_out) {
    *error_out = "ONNX embedder requires RAGRANK_ENABLE_SEMANTIC=ON";
  }
  return nullptr;
}

#endif  // RAGRANK_ENABLE_SEMANTIC

}  // namespace ragrank
