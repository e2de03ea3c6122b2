#include <ragrank/config.hpp>

#include <ragrank/text_analyzer.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ragrank {

namespace {

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) { return internal::TrimWhitespace(s); }

std::string Unquote(std::string value) {
  if (value.size() >= 2 &&
      ((value.front() == '"' && value.back() == '"') ||
       (value.front() == '\'' && value.back() == '\''))) {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

// Drop a trailing "# comment" outside quotes.
std::string StripComment(const std::string& line) {
  char quote = 0;
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote) {
      if (c == quote) quote = 0;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
      return line.substr(0, i);
    }
  }
  return line;
}

class ValueReader {
 public:
  ValueReader(const std::string& section, const std::string& key, const std::string& value,
              size_t line_no)
      : where_(Where(section, key, line_no)), value_(value) {}

  std::string String() const { return value_; }

  bool Bool() const {
    const std::string v = internal::FoldCase(value_);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw std::runtime_error(where_ + ": expected a boolean, got '" + value_ + "'");
  }

  uint64_t Unsigned() const {
    if (value_.empty() || value_[0] == '-') {
      throw std::runtime_error(where_ + ": expected a non-negative integer, got '" + value_ + "'");
    }
    try {
      size_t used = 0;
      const unsigned long long v = std::stoull(value_, &used);
      if (used != value_.size()) throw std::invalid_argument(value_);
      return static_cast<uint64_t>(v);
    } catch (const std::logic_error&) {
      throw std::runtime_error(where_ + ": expected a non-negative integer, got '" + value_ + "'");
    }
  }

  int Int() const {
    try {
      size_t used = 0;
      const int v = std::stoi(value_, &used);
      if (used != value_.size()) throw std::invalid_argument(value_);
      return v;
    } catch (const std::logic_error&) {
      throw std::runtime_error(where_ + ": expected an integer, got '" + value_ + "'");
    }
  }

  double Double() const {
    try {
      size_t used = 0;
      const double v = std::stod(value_, &used);
      if (used != value_.size()) throw std::invalid_argument(value_);
      return v;
    } catch (const std::logic_error&) {
      throw std::runtime_error(where_ + ": expected a number, got '" + value_ + "'");
    }
  }

  void Check(const rocksdb::Status& s) const {
    if (!s.ok()) throw std::runtime_error(where_ + ": " + s.ToString());
  }

  [[noreturn]] void Unknown() const {
    throw std::runtime_error(where_ + ": unknown key");
  }

 private:
  static std::string Where(const std::string& section, const std::string& key, size_t line_no) {
    return "line " + std::to_string(line_no) + " (" +
           (section.empty() ? key : section + "." + key) + ")";
  }

  std::string where_;
  std::string value_;
};

rocksdb::Status ParseMetric(const std::string& name, NativeMetric* out) {
  const std::string v = internal::FoldCase(name);
  if (v == "cosine") {
    *out = NativeMetric::kCosine;
  } else if (v == "l2") {
    *out = NativeMetric::kL2;
  } else if (v == "dot") {
    *out = NativeMetric::kDot;
  } else {
    return rocksdb::Status::InvalidArgument("unknown metric: " + name);
  }
  return rocksdb::Status::OK();
}

rocksdb::Status ParseModelType(const std::string& name, EmbedderModelType* out) {
  const std::string v = internal::FoldCase(name);
  if (v == "minilm") {
    *out = EmbedderModelType::kMiniLM;
  } else if (v == "bge-small" || v == "bge_small") {
    *out = EmbedderModelType::kBGESmall;
  } else if (v == "bge-large" || v == "bge_large") {
    *out = EmbedderModelType::kBGELarge;
  } else {
    return rocksdb::Status::InvalidArgument("unknown embedding model type: " + name);
  }
  return rocksdb::Status::OK();
}

void Apply(EngineConfig* config, const std::string& section, const std::string& key,
           const ValueReader& v) {
  Options& o = config->options;

  if (section.empty()) {
    if (key == "db_path") {
      config->db_path = v.String();
    } else {
      v.Unknown();
    }
  } else if (section == "store") {
    if (key == "path") {
      config->db_path = v.String();
    } else if (key == "block_cache_bytes") {
      o.block_cache_bytes = v.Unsigned();
    } else if (key == "bloom_bits_per_key") {
      o.bloom_bits_per_key = v.Int();
    } else {
      v.Unknown();
    }
  } else if (section == "retrieval") {
    if (key == "mode") {
      v.Check(ParseSearchMode(v.String(), &config->default_mode));
    } else if (key == "default_limit") {
      o.default_limit = v.Unsigned();
    } else if (key == "min_score") {
      o.min_score = v.Double();
    } else if (key == "candidate_multiplier") {
      o.candidate_multiplier = v.Unsigned();
    } else if (key == "semantic_weight") {
      o.semantic_weight = v.Double();
    } else if (key == "keyword_weight") {
      o.keyword_weight = v.Double();
    } else if (key == "filter_overfetch") {
      o.filter_overfetch = v.Unsigned();
    } else if (key == "bm25_k1") {
      o.bm25.k1 = v.Double();
    } else if (key == "bm25_b") {
      o.bm25.b = v.Double();
    } else if (key == "bm25_saturation") {
      o.bm25.saturation = v.Double();
    } else if (key == "drop_stopwords") {
      o.bm25.drop_stopwords = v.Bool();
    } else {
      v.Unknown();
    }
  } else if (section == "fusion") {
    if (key == "k_rrf") {
      o.k_rrf = v.Double();
    } else {
      v.Unknown();
    }
  } else if (section == "decomposition") {
    if (key == "enabled") {
      config->default_decompose = v.Bool();
    } else if (key == "strategy") {
      v.Check(ParseDecompositionStrategy(v.String(), &o.decomposition_strategy));
    } else if (key == "max_sub_queries") {
      o.max_sub_queries = v.Unsigned();
    } else if (key == "aggregation") {
      v.Check(ParseAggregationMethod(v.String(), &o.aggregation));
    } else if (key == "weighted_decay") {
      o.weighted_decay = v.Double();
    } else if (key == "llm_model_path") {
      o.llm_model_path = v.String();
    } else if (key == "llm_gpu_layers") {
      o.llm_gpu_layers = v.Int();
    } else if (key == "llm_max_tokens") {
      o.llm_max_tokens = v.Int();
    } else {
      v.Unknown();
    }
  } else if (section == "reranker") {
    if (key == "enabled") {
      config->default_rerank = v.Bool();
    } else if (key == "model_path") {
      o.cross_encoder_model_path = v.String();
    } else if (key == "candidates") {
      o.rerank_candidates = v.Unsigned();
    } else if (key == "min_score") {
      o.rerank_min_score = v.Double();
    } else {
      v.Unknown();
    }
  } else if (section == "embedding") {
    if (key == "model_path") {
      o.embedding_model_path = v.String();
    } else if (key == "model_type") {
      v.Check(ParseModelType(v.String(), &o.embedding_model_type));
    } else if (key == "threads") {
      o.inference_threads = v.Int();
    } else if (key == "backend") {
      const std::string b = internal::FoldCase(v.String());
      if (b == "exact") {
        o.vector_backend = VectorBackendType::kExact;
      } else if (b == "hnsw") {
        o.vector_backend = VectorBackendType::kHNSW;
      } else {
        v.Check(rocksdb::Status::InvalidArgument("unknown vector backend: " + v.String()));
      }
    } else if (key == "metric") {
      v.Check(ParseMetric(v.String(), &o.vector_metric));
    } else {
      v.Unknown();
    }
  } else if (section == "hnsw") {
    if (key == "initial_capacity") {
      o.hnsw.initial_capacity = v.Unsigned();
    } else if (key == "m") {
      o.hnsw.m = v.Int();
    } else if (key == "ef_construction") {
      o.hnsw.ef_construction = v.Int();
    } else if (key == "ef_search") {
      o.hnsw.ef_search = v.Int();
    } else {
      v.Unknown();
    }
  } else if (section == "concurrency") {
    if (key == "max_concurrency") {
      o.max_concurrency = v.Unsigned();
    } else if (key == "query_timeout_ms") {
      o.query_timeout_ms = v.Unsigned();
    } else {
      v.Unknown();
    }
  } else {
    throw std::runtime_error("unknown section: " + section);
  }
}

}  // namespace

EngineConfig EngineConfig::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return Parse(buffer.str());
}

EngineConfig EngineConfig::Parse(const std::string& text) {
  EngineConfig config;
  std::string current_section;
  std::istringstream in(text);
  std::string raw;
  size_t line_no = 0;

  while (std::getline(in, raw)) {
    ++line_no;
    const bool indented = !raw.empty() && (raw[0] == ' ' || raw[0] == '\t');
    const std::string line = Trim(StripComment(raw));

    // Skip empty lines and comments
    if (line.empty()) continue;

    const size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error("line " + std::to_string(line_no) + ": expected 'key: value'");
    }
    const std::string key = Trim(line.substr(0, colon_pos));
    const std::string value = Unquote(Trim(line.substr(colon_pos + 1)));

    // A key with no value opens a section
    if (value.empty()) {
      if (indented) {
        throw std::runtime_error("line " + std::to_string(line_no) + ": nested sections are not supported");
      }
      current_section = key;
      continue;
    }
    if (!indented) current_section.clear();

    Apply(&config, current_section, key, ValueReader(current_section, key, value, line_no));
  }

  return config;
}

void EngineConfig::Validate() const {
  if (db_path.empty()) {
    throw std::runtime_error("db_path is required");
  }
  if (options.bloom_bits_per_key < 0) {
    throw std::runtime_error("store.bloom_bits_per_key must be >= 0");
  }
  if (options.hnsw.m <= 0 || options.hnsw.ef_construction <= 0 || options.hnsw.ef_search <= 0) {
    throw std::runtime_error("hnsw.m, hnsw.ef_construction and hnsw.ef_search must be > 0");
  }
  if (options.llm_max_tokens <= 0) {
    throw std::runtime_error("decomposition.llm_max_tokens must be > 0");
  }

  rocksdb::Status s = ValidateOptions(options);
  if (!s.ok()) throw std::runtime_error(s.ToString());

  std::string error;
  if (!CreateBm25Index(options.bm25, &error)) {
    throw std::runtime_error(error);
  }
}

SearchRequest EngineConfig::MakeRequest(const std::string& query) const {
  SearchRequest request;
  request.query = query;
  request.mode = default_mode;
  request.decompose = default_decompose;
  request.rerank = default_rerank;
  return request;
}

}  // namespace ragrank
