// Unit tests for ragrank/config.hpp

#include <gtest/gtest.h>

#include <ragrank/config.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

namespace ragrank {
namespace {

// =============================================================================
// Parsing
// =============================================================================

TEST(EngineConfigTest, ParsesEverySection) {
  EngineConfig config = EngineConfig::Parse(R"(
# engine settings
db_path: "/data/ragrank"

store:
  block_cache_bytes: 1048576
  bloom_bits_per_key: 12

retrieval:
  mode: keyword
  default_limit: 20
  min_score: 0.1
  candidate_multiplier: 5
  semantic_weight: 0.6
  keyword_weight: 0.4   # display only
  filter_overfetch: 8
  bm25_k1: 1.5
  bm25_b: 0.5
  bm25_saturation: 12
  drop_stopwords: false

fusion:
  k_rrf: 30

decomposition:
  enabled: true
  strategy: llm
  max_sub_queries: 4
  aggregation: weighted
  weighted_decay: 0.25
  llm_model_path: /models/qwen.gguf
  llm_gpu_layers: 10
  llm_max_tokens: 128

reranker:
  enabled: yes
  model_path: /models/bge-reranker/model.onnx
  candidates: 50
  min_score: 0.2

embedding:
  model_path: /models/bge-small/model.onnx
  model_type: bge-small
  threads: 2
  backend: hnsw
  metric: l2

hnsw:
  initial_capacity: 5000
  m: 32
  ef_construction: 100
  ef_search: 64

concurrency:
  max_concurrency: 16
  query_timeout_ms: 250
)");

  EXPECT_EQ(config.db_path, "/data/ragrank");
  EXPECT_EQ(config.default_mode, SearchMode::kKeyword);
  EXPECT_TRUE(config.default_decompose);
  EXPECT_TRUE(config.default_rerank);

  const Options& o = config.options;
  EXPECT_EQ(o.block_cache_bytes, 1048576u);
  EXPECT_EQ(o.bloom_bits_per_key, 12);
  EXPECT_EQ(o.default_limit, 20u);
  EXPECT_DOUBLE_EQ(o.min_score, 0.1);
  EXPECT_EQ(o.candidate_multiplier, 5u);
  EXPECT_DOUBLE_EQ(o.semantic_weight, 0.6);
  EXPECT_DOUBLE_EQ(o.keyword_weight, 0.4);
  EXPECT_EQ(o.filter_overfetch, 8u);
  EXPECT_DOUBLE_EQ(o.bm25.k1, 1.5);
  EXPECT_DOUBLE_EQ(o.bm25.b, 0.5);
  EXPECT_DOUBLE_EQ(o.bm25.saturation, 12.0);
  EXPECT_FALSE(o.bm25.drop_stopwords);
  EXPECT_DOUBLE_EQ(o.k_rrf, 30.0);
  EXPECT_EQ(o.decomposition_strategy, DecompositionStrategy::kLLM);
  EXPECT_EQ(o.max_sub_queries, 4u);
  EXPECT_EQ(o.aggregation, AggregationMethod::kWeighted);
  EXPECT_DOUBLE_EQ(o.weighted_decay, 0.25);
  EXPECT_EQ(o.llm_model_path, "/models/qwen.gguf");
  EXPECT_EQ(o.llm_gpu_layers, 10);
  EXPECT_EQ(o.llm_max_tokens, 128);
  EXPECT_EQ(o.cross_encoder_model_path, "/models/bge-reranker/model.onnx");
  EXPECT_EQ(o.rerank_candidates, 50u);
  ASSERT_TRUE(o.rerank_min_score.has_value());
  EXPECT_DOUBLE_EQ(*o.rerank_min_score, 0.2);
  EXPECT_EQ(o.embedding_model_path, "/models/bge-small/model.onnx");
  EXPECT_EQ(o.embedding_model_type, EmbedderModelType::kBGESmall);
  EXPECT_EQ(o.inference_threads, 2);
  EXPECT_EQ(o.vector_backend, VectorBackendType::kHNSW);
  EXPECT_EQ(o.vector_metric, NativeMetric::kL2);
  EXPECT_EQ(o.hnsw.initial_capacity, 5000u);
  EXPECT_EQ(o.hnsw.m, 32);
  EXPECT_EQ(o.hnsw.ef_construction, 100);
  EXPECT_EQ(o.hnsw.ef_search, 64);
  EXPECT_EQ(o.max_concurrency, 16u);
  EXPECT_EQ(o.query_timeout_ms, 250u);

  EXPECT_NO_THROW(config.Validate());
}

TEST(EngineConfigTest, DefaultsWhenOnlyDbPathGiven) {
  EngineConfig config = EngineConfig::Parse("db_path: /tmp/x\n");
  EXPECT_EQ(config.default_mode, SearchMode::kHybrid);
  EXPECT_DOUBLE_EQ(config.options.k_rrf, 60.0);
  EXPECT_EQ(config.options.aggregation, AggregationMethod::kMax);
  EXPECT_NO_THROW(config.Validate());
}

TEST(EngineConfigTest, StorePathAliasesDbPath) {
  EngineConfig config = EngineConfig::Parse("store:\n  path: /srv/chunks\n");
  EXPECT_EQ(config.db_path, "/srv/chunks");
}

TEST(EngineConfigTest, UnindentedKeyLeavesSection) {
  EngineConfig config = EngineConfig::Parse("fusion:\n  k_rrf: 10\ndb_path: /a\n");
  EXPECT_EQ(config.db_path, "/a");
  EXPECT_DOUBLE_EQ(config.options.k_rrf, 10.0);
}

TEST(EngineConfigTest, HashInsideQuotesIsKept) {
  EngineConfig config = EngineConfig::Parse("db_path: \"/data/#1\"  # primary\n");
  EXPECT_EQ(config.db_path, "/data/#1");
}

TEST(EngineConfigTest, MakeRequestCarriesDefaults) {
  EngineConfig config = EngineConfig::Parse(
      "retrieval:\n  mode: semantic\ndecomposition:\n  enabled: true\n");
  SearchRequest request = config.MakeRequest("what is rrf");
  EXPECT_EQ(request.query, "what is rrf");
  EXPECT_EQ(request.mode, SearchMode::kSemantic);
  EXPECT_TRUE(request.decompose);
  EXPECT_FALSE(request.rerank);
}

// =============================================================================
// Errors
// =============================================================================

TEST(EngineConfigTest, RejectsUnknownKeysAndSections) {
  EXPECT_THROW(EngineConfig::Parse("fusion:\n  k: 60\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("server:\n  port: 80\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("port: 80\n"), std::runtime_error);
  // The reranked list is cut to the request limit; there is no top_k knob.
  EXPECT_THROW(EngineConfig::Parse("reranker:\n  top_k: 5\n"), std::runtime_error);
}

TEST(EngineConfigTest, ErrorNamesLineAndKey) {
  try {
    EngineConfig::Parse("db_path: /x\nretrieval:\n  default_limit: many\n");
    FAIL() << "expected a parse error";
  } catch (const std::runtime_error& e) {
    const std::string msg = e.what();
    EXPECT_NE(msg.find("line 3"), std::string::npos) << msg;
    EXPECT_NE(msg.find("retrieval.default_limit"), std::string::npos) << msg;
  }
}

TEST(EngineConfigTest, RejectsBadValues) {
  EXPECT_THROW(EngineConfig::Parse("retrieval:\n  default_limit: -3\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("retrieval:\n  min_score: 0.5x\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("retrieval:\n  drop_stopwords: maybe\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("retrieval:\n  mode: fuzzy\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("decomposition:\n  aggregation: median\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("embedding:\n  metric: hamming\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("embedding:\n  backend: faiss\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("just text\n"), std::runtime_error);
  EXPECT_THROW(EngineConfig::Parse("a:\n  b:\n"), std::runtime_error);
}

TEST(EngineConfigTest, ValidateCatchesInvalidCombinations) {
  EXPECT_THROW(EngineConfig::Parse("fusion:\n  k_rrf: 60\n").Validate(), std::runtime_error);

  EngineConfig zero_k = EngineConfig::Parse("db_path: /x\nfusion:\n  k_rrf: 0\n");
  EXPECT_THROW(zero_k.Validate(), std::runtime_error);

  EngineConfig cosine_hnsw =
      EngineConfig::Parse("db_path: /x\nembedding:\n  backend: hnsw\n  metric: cosine\n");
  EXPECT_THROW(cosine_hnsw.Validate(), std::runtime_error);

  EngineConfig bad_b = EngineConfig::Parse("db_path: /x\nretrieval:\n  bm25_b: 2\n");
  EXPECT_THROW(bad_b.Validate(), std::runtime_error);

  EngineConfig bad_decay =
      EngineConfig::Parse("db_path: /x\ndecomposition:\n  weighted_decay: 1.5\n");
  EXPECT_THROW(bad_decay.Validate(), std::runtime_error);
}

// =============================================================================
// Files
// =============================================================================

TEST(EngineConfigTest, LoadFromFile) {
  const auto path = std::filesystem::temp_directory_path() /
                    ("ragrank_config_" + std::to_string(std::random_device{}()) + ".yaml");
  {
    std::ofstream out(path);
    out << "db_path: /var/lib/ragrank\nconcurrency:\n  max_concurrency: 2\n";
  }
  EngineConfig config = EngineConfig::LoadFromFile(path.string());
  EXPECT_EQ(config.db_path, "/var/lib/ragrank");
  EXPECT_EQ(config.options.max_concurrency, 2u);

  std::error_code ec;
  std::filesystem::remove(path, ec);
  EXPECT_THROW(EngineConfig::LoadFromFile(path.string()), std::runtime_error);
}

}  // namespace
}  // namespace ragrank
