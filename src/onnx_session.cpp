#include <ragrank/onnx_session.hpp>

#ifdef RAGRANK_ENABLE_SEMANTIC

#include <algorithm>
#include <fstream>

namespace ragrank::internal {

OnnxBatch PackBatch(const std::vector<TokenizerResult>& rows, int64_t pad_token_id) {
  OnnxBatch batch;
  batch.batch = static_cast<int64_t>(rows.size());
  for (const auto& row : rows) {
    batch.seq_len = std::max(batch.seq_len, static_cast<int64_t>(row.input_ids.size()));
  }

  const size_t total = static_cast<size_t>(batch.batch * batch.seq_len);
  batch.input_ids.assign(total, pad_token_id);
  batch.attention_mask.assign(total, 0);
  batch.token_type_ids.assign(total, 0);

  for (size_t r = 0; r < rows.size(); ++r) {
    const size_t offset = r * static_cast<size_t>(batch.seq_len);
    std::copy(rows[r].input_ids.begin(), rows[r].input_ids.end(),
              batch.input_ids.begin() + offset);
    std::copy(rows[r].attention_mask.begin(), rows[r].attention_mask.end(),
              batch.attention_mask.begin() + offset);
    std::copy(rows[r].token_type_ids.begin(), rows[r].token_type_ids.end(),
              batch.token_type_ids.begin() + offset);
  }
  return batch;
}

OnnxSession::OnnxSession(const char* log_id)
    : env_(ORT_LOGGING_LEVEL_WARNING, log_id),
      memory_info_(Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                              OrtMemType::OrtMemTypeDefault)) {}

bool OnnxSession::Load(const std::string& model_path, int num_threads,
                       std::string* error_out) {
  try {
    Ort::SessionOptions session_options;
    session_options.SetIntraOpNumThreads(num_threads);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

    session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), session_options);

    Ort::AllocatorWithDefaultOptions allocator;
    for (size_t i = 0; i < session_->GetInputCount(); ++i) {
      input_names_str_.push_back(session_->GetInputNameAllocated(i, allocator).get());
    }
    for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
      output_names_str_.push_back(session_->GetOutputNameAllocated(i, allocator).get());
    }
    for (const auto& s : input_names_str_) input_names_.push_back(s.c_str());
    for (const auto& s : output_names_str_) output_names_.push_back(s.c_str());
    return true;
  } catch (const Ort::Exception& e) {
    if (error_out) *error_out = e.what();
    return false;
  } catch (const std::exception& e) {
    if (error_out) *error_out = e.what();
    return false;
  }
}

std::vector<Ort::Value> OnnxSession::Run(OnnxBatch* batch, std::string* error_out) const {
  if (!session_) {
    if (error_out) *error_out = "ONNX session not loaded";
    return {};
  }

  try {
    const std::vector<int64_t> shape = {batch->batch, batch->seq_len};

    std::vector<Ort::Value> inputs;
    for (const auto& name : input_names_str_) {
      std::vector<int64_t>* data = nullptr;
      if (name == "input_ids") {
        data = &batch->input_ids;
      } else if (name == "attention_mask") {
        data = &batch->attention_mask;
      } else if (name == "token_type_ids") {
        data = &batch->token_type_ids;
      } else {
        if (error_out) *error_out = "Unknown input name: " + name;
        return {};
      }
      inputs.push_back(Ort::Value::CreateTensor<int64_t>(
          memory_info_, data->data(), data->size(), shape.data(), shape.size()));
    }

    auto outputs = session_->Run(Ort::RunOptions{nullptr}, input_names_.data(),
                                 inputs.data(), inputs.size(), output_names_.data(),
                                 output_names_.size());
    if (outputs.empty() && error_out) *error_out = "No output tensors";
    return outputs;
  } catch (const Ort::Exception& e) {
    if (error_out) *error_out = e.what();
  } catch (const std::exception& e) {
    if (error_out) *error_out = e.what();
  }
  return {};
}

std::string FindSiblingFile(const std::string& model_path, const std::string& filename) {
  const size_t last_slash = model_path.find_last_of("/\\");
  const std::string dir =
      last_slash != std::string::npos ? model_path.substr(0, last_slash + 1) : "./";
  const std::string path = dir + filename;
  std::ifstream check(path);
  return check.good() ? path : "";
}

}  // namespace ragrank::internal

#endif  // RAGRANK_ENABLE_SEMANTIC
