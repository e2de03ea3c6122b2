#include <ragrank/llm_decomposer.hpp>

#ifdef RAGRANK_ENABLE_LLAMA
#include <llama.h>

#include <mutex>
#include <thread>
#include <vector>
#endif

namespace ragrank::internal {

constexpr const char* kDecompositionPromptTemplate = R"(Break down this search query into simpler, self-contained sub-queries.
Return a JSON array of at most {max} strings and nothing else.
If the query is already simple, return an array holding just the original query.

Query: {query}

Sub-queries:
)";

std::string FormatDecompositionPrompt(std::string_view query, size_t max_sub_queries) {
  std::string prompt = kDecompositionPromptTemplate;

  size_t pos = prompt.find("{max}");
  if (pos != std::string::npos) {
    prompt.replace(pos, 5, std::to_string(max_sub_queries));
  }
  pos = prompt.find("{query}");
  if (pos != std::string::npos) {
    prompt.replace(pos, 7, query);
  }
  return prompt;
}

#ifdef RAGRANK_ENABLE_LLAMA

class LlamaSubQueryGenerator::Impl {
 public:
  Impl(int num_threads, int context_size, int gpu_layers, int max_tokens)
      : num_threads_(num_threads),
        context_size_(context_size),
        gpu_layers_(gpu_layers),
        max_tokens_(max_tokens) {}

  ~Impl() {
    if (model_) {
      llama_model_free(model_);
    }
  }

  bool Initialize(const std::string& model_path, std::string* error_out) {
    llama_backend_init();

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = gpu_layers_;

    model_ = llama_model_load_from_file(model_path.c_str(), model_params);
    if (!model_) {
      if (error_out) {
        *error_out = "Failed to load model from: " + model_path;
      }
      return false;
    }
    vocab_ = llama_model_get_vocab(model_);
    return true;
  }

  GenerationResult Generate(std::string_view query, size_t max_sub_queries) const {
    GenerationResult result;

    if (!model_) {
      result.error_message = "Sub-query model not initialized";
      return result;
    }

    std::string prompt = FormatDecompositionPrompt(query, max_sub_queries);

    std::vector<llama_token> tokens(context_size_);
    int n_tokens = llama_tokenize(vocab_, prompt.c_str(), static_cast<int32_t>(prompt.size()),
                                  tokens.data(), static_cast<int32_t>(tokens.size()),
                                  true, false);
    if (n_tokens < 0) {
      result.error_message = "Tokenization failed";
      return result;
    }
    tokens.resize(n_tokens);

    if (n_tokens + max_tokens_ > context_size_) {
      result.error_message = "Prompt too long for context window";
      return result;
    }

    // One context per call: the KV cache never carries over between queries.
    std::lock_guard<std::mutex> lock(mutex_);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = context_size_;
    ctx_params.n_threads = num_threads_ > 0
                               ? num_threads_
                               : static_cast<int>(std::thread::hardware_concurrency());
    ctx_params.n_threads_batch = ctx_params.n_threads;

    llama_context* ctx = llama_init_from_model(model_, ctx_params);
    if (!ctx) {
      result.error_message = "Failed to create llama context";
      return result;
    }

    if (llama_decode(ctx, llama_batch_get_one(tokens.data(), n_tokens)) != 0) {
      llama_free(ctx);
      result.error_message = "Failed to process prompt";
      return result;
    }

    const int n_vocab = llama_vocab_n_tokens(vocab_);
    std::string response;
    for (int i = 0; i < max_tokens_; ++i) {
      const float* logits = llama_get_logits_ith(ctx, -1);

      // Greedy sampling
      llama_token next = 0;
      float max_logit = logits[0];
      for (int j = 1; j < n_vocab; ++j) {
        if (logits[j] > max_logit) {
          max_logit = logits[j];
          next = j;
        }
      }

      if (llama_vocab_is_eog(vocab_, next)) {
        break;
      }

      char buf[256];
      int n = llama_token_to_piece(vocab_, next, buf, sizeof(buf), 0, false);
      if (n > 0) {
        response.append(buf, n);
      }

      if (llama_decode(ctx, llama_batch_get_one(&next, 1)) != 0) {
        break;
      }
    }
    llama_free(ctx);

    result.sub_queries = ParseSubQueryResponse(response, max_sub_queries);
    if (result.sub_queries.empty()) {
      result.error_message = "No sub-queries in model response: " + response;
      return result;
    }
    result.success = true;
    return result;
  }

 private:
  int num_threads_;
  int context_size_;
  int gpu_layers_;
  int max_tokens_;

  llama_model* model_ = nullptr;
  const llama_vocab* vocab_ = nullptr;
  mutable std::mutex mutex_;
};

#else  // !RAGRANK_ENABLE_LLAMA

class LlamaSubQueryGenerator::Impl {
 public:
  Impl(int, int, int, int) {}

  bool Initialize(const std::string&, std::string* error_out) {
    if (error_out) {
      *error_out = "llama.cpp not available. Build with RAGRANK_ENABLE_LLAMA=ON";
    }
    return false;
  }

  GenerationResult Generate(std::string_view, size_t) const {
    GenerationResult result;
    result.error_message = "llama.cpp not available";
    return result;
  }
};

#endif  // RAGRANK_ENABLE_LLAMA

LlamaSubQueryGenerator::LlamaSubQueryGenerator(int num_threads, int context_size,
                                               int gpu_layers, int max_tokens)
    : impl_(std::make_unique<Impl>(num_threads, context_size, gpu_layers, max_tokens)) {}

LlamaSubQueryGenerator::~LlamaSubQueryGenerator() = default;

bool LlamaSubQueryGenerator::Initialize(const std::string& model_path,
                                        std::string* error_out) {
  return impl_->Initialize(model_path, error_out);
}

GenerationResult LlamaSubQueryGenerator::Generate(std::string_view query,
                                                  size_t max_sub_queries) const {
  return impl_->Generate(query, max_sub_queries);
}

std::unique_ptr<SubQueryGenerator> CreateLlamaSubQueryGenerator(
    const std::string& model_path,
    int num_threads,
    int context_size,
    int gpu_layers,
    int max_tokens,
    std::string* error_out) {
  auto generator = std::make_unique<LlamaSubQueryGenerator>(
      num_threads, context_size, gpu_layers, max_tokens);

  if (!generator->Initialize(model_path, error_out)) {
    return nullptr;
  }
  return generator;
}

}  // namespace ragrank::internal
