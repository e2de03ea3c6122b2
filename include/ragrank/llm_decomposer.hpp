#pragma once

#include <ragrank/decomposer.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace ragrank::internal {

/**
 * Sub-query generator running a local instruction-tuned model through
 * llama.cpp (GGUF files, optional GPU offload).
 *
 * The model is asked for a JSON array of sub-queries; the reply is parsed
 * with ParseSubQueryResponse(), so plain line lists are accepted as well.
 * Generation is greedy and serialized per instance.
 */
class LlamaSubQueryGenerator : public SubQueryGenerator {
 public:
  /**
   * @param num_threads Number of threads for inference (0 = all cores)
   * @param context_size Context window size
   * @param gpu_layers Number of layers to offload to GPU (0 = CPU only, -1 = all)
   * @param max_tokens Maximum tokens for response generation
   */
  explicit LlamaSubQueryGenerator(int num_threads = 0,
                                  int context_size = 2048,
                                  int gpu_layers = 0,
                                  int max_tokens = 200);

  ~LlamaSubQueryGenerator();

  /**
   * Load the model.
   *
   * @param model_path Path to GGUF model file
   * @param error_out Error message output
   * @return true if initialization successful
   */
  bool Initialize(const std::string& model_path, std::string* error_out);

  GenerationResult Generate(std::string_view query,
                            size_t max_sub_queries) const override;

  std::string ModelType() const override { return "llama.cpp"; }

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

/** Prompt sent to the model for one query. */
std::string FormatDecompositionPrompt(std::string_view query, size_t max_sub_queries);

/**
 * Factory: load a GGUF model and return a ready generator, or nullptr with
 * error_out set (including when built without RAGRANK_ENABLE_LLAMA).
 */
std::unique_ptr<SubQueryGenerator> CreateLlamaSubQueryGenerator(
    const std::string& model_path,
    int num_threads = 0,
    int context_size = 2048,
    int gpu_layers = 0,
    int max_tokens = 200,
    std::string* error_out = nullptr);

}  // namespace ragrank::internal
