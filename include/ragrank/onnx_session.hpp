#pragma once

#ifdef RAGRANK_ENABLE_SEMANTIC

#include <ragrank/tokenizer.hpp>

#include <onnxruntime_cxx_api.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ragrank::internal {

/**
 * Right-padded [batch, seq_len] model input built from tokenized rows.
 */
struct OnnxBatch {
  std::vector<int64_t> input_ids;
  std::vector<int64_t> attention_mask;
  std::vector<int64_t> token_type_ids;
  int64_t batch = 0;
  int64_t seq_len = 0;
};

OnnxBatch PackBatch(const std::vector<TokenizerResult>& rows, int64_t pad_token_id);

/**
 * Thin wrapper over an ONNX Runtime session for BERT-style encoders.
 * Inputs are bound by name (input_ids, attention_mask, token_type_ids).
 * Run() may be called concurrently.
 */
class OnnxSession {
 public:
  explicit OnnxSession(const char* log_id);

  /** num_threads: 0 = runtime default. */
  bool Load(const std::string& model_path, int num_threads, std::string* error_out);

  /** Empty on failure, with error_out set. */
  std::vector<Ort::Value> Run(OnnxBatch* batch, std::string* error_out) const;

 private:
  Ort::Env env_;
  Ort::MemoryInfo memory_info_;
  std::unique_ptr<Ort::Session> session_;

  std::vector<std::string> input_names_str_;
  std::vector<std::string> output_names_str_;
  std::vector<const char*> input_names_;
  std::vector<const char*> output_names_;
};

/** filename in the model's directory if it exists, else "". */
std::string FindSiblingFile(const std::string& model_path, const std::string& filename);

}  // namespace ragrank::internal

#endif  // RAGRANK_ENABLE_SEMANTIC
