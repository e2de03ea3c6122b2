// Performance benchmarks for ragrank ranking and retrieval
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: CPU-bound ranking stages (analysis, BM25, fusion,
//    aggregation, normalisation). No I/O.
// 2. MACROBENCHMARKS: Retriever operations (Index, Search) against a
//    RocksDB chunk store.
//
// Corpora are generated once per benchmark outside the timing loop.

#include <benchmark/benchmark.h>

#include <ragrank/aggregator.hpp>
#include <ragrank/chunk_store.hpp>
#include <ragrank/fusion.hpp>
#include <ragrank/lexical_index.hpp>
#include <ragrank/retriever.hpp>
#include <ragrank/score_normalizer.hpp>
#include <ragrank/test_utils.hpp>
#include <ragrank/text_analyzer.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

const std::vector<std::string>& Vocabulary() {
  static const std::vector<std::string> words = {
      "rust",    "ownership", "borrow",   "checker",  "lifetime", "python",  "garbage",
      "collector", "goroutine", "channel", "scheduler", "thread",  "memory",  "allocator",
      "vector",  "index",     "ranking",  "fusion",   "query",    "token",   "embedding",
      "latency", "throughput", "cache",   "compaction", "segment", "replica", "shard"};
  return words;
}

std::string RandomSentence(std::mt19937& gen, size_t words) {
  const auto& vocab = Vocabulary();
  std::uniform_int_distribution<size_t> dis(0, vocab.size() - 1);
  std::string out;
  for (size_t i = 0; i < words; ++i) {
    if (i) out += ' ';
    out += vocab[dis(gen)];
  }
  return out;
}

std::vector<ragrank::Chunk> MakeCorpus(size_t n, size_t dim, std::mt19937& gen) {
  ragrank::testing::DeterministicEmbedder embedder(dim);
  std::vector<ragrank::Chunk> chunks;
  chunks.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    ragrank::Chunk c;
    c.source_document_id = "doc-" + std::to_string(i / 16);
    c.position = static_cast<uint32_t>(i % 16);
    c.id = ragrank::MakeChunkId(c.source_document_id, c.position);
    c.text = RandomSentence(gen, 40);
    if (dim > 0) c.embedding = embedder.Embed(c.text).embedding;
    chunks.push_back(std::move(c));
  }
  return chunks;
}

ragrank::RankedList MakeList(ragrank::AdapterKind adapter, size_t n, size_t offset) {
  ragrank::RankedList list(adapter);
  for (size_t i = 0; i < n; ++i) {
    const double score = 1.0 - static_cast<double>(i) / static_cast<double>(n);
    list.Append("chunk-" + std::to_string(i + offset), score, score);
  }
  return list;
}

// =============================================================================
// Benchmark Fixtures
// =============================================================================

class RetrieverBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    std::error_code ec;
    std::filesystem::path temp_base = std::filesystem::temp_directory_path(ec);
    if (ec || temp_base.empty()) temp_base = ".";
    test_dir_ = temp_base / ("ragrank_bench_" + std::to_string(std::random_device{}() % 1000000));
    std::filesystem::create_directories(test_dir_, ec);

    ragrank::Options opt;
    opt.custom_embedder = std::make_shared<ragrank::testing::DeterministicEmbedder>(kDim);
    opt.query_timeout_ms = 0;
    auto s = ragrank::Retriever::Open((test_dir_ / "bench_db").string(), &retriever_, opt);
    if (!s.ok()) return;

    std::mt19937 gen(42);
    corpus_ = MakeCorpus(static_cast<size_t>(state.range(0)), kDim, gen);
  }

  void TearDown(const benchmark::State& state) override {
    retriever_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  static constexpr size_t kDim = 32;

  std::filesystem::path test_dir_;
  std::unique_ptr<ragrank::Retriever> retriever_;
  std::vector<ragrank::Chunk> corpus_;
};

// =============================================================================
// PART 1: MICROBENCHMARKS - CPU-bound ranking stages
// =============================================================================

static void BM_AnalyzeText(benchmark::State& state) {
  std::mt19937 gen(1);
  const std::string text = RandomSentence(gen, static_cast<size_t>(state.range(0)));
  for (auto _ : state) {
    auto tokens = ragrank::AnalyzeText(text);
    benchmark::DoNotOptimize(tokens);
  }
  state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_AnalyzeText)->Range(8, 1024);

static void BM_NormalizeScores_Cosine(benchmark::State& state) {
  std::mt19937 gen(2);
  std::uniform_real_distribution<double> dis(-1.0, 1.0);
  std::vector<double> raw(static_cast<size_t>(state.range(0)));
  for (auto& v : raw) v = dis(gen);
  for (auto _ : state) {
    auto out = ragrank::NormalizeScores(raw, ragrank::NativeMetric::kCosine);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_NormalizeScores_Cosine)->Range(16, 1024);

static void BM_Bm25_Search(benchmark::State& state) {
  auto index = ragrank::CreateBm25Index();
  std::mt19937 gen(3);
  for (const auto& c : MakeCorpus(static_cast<size_t>(state.range(0)), 0, gen)) {
    if (!index->Add(c).ok()) {
      state.SkipWithError("Add failed");
      return;
    }
  }
  for (auto _ : state) {
    ragrank::RankedList out;
    auto s = index->Search("borrow checker lifetime", 30, {}, &out);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_Bm25_Search)->Range(256, 16384);

static void BM_Fusion_TwoLists(benchmark::State& state) {
  const size_t n = static_cast<size_t>(state.range(0));
  std::vector<ragrank::LabeledList> lists = {
      {"semantic#0", MakeList(ragrank::AdapterKind::kSemantic, n, 0)},
      {"lexical#0", MakeList(ragrank::AdapterKind::kLexical, n, n / 2)},
  };
  ragrank::FusionEngine fusion;
  for (auto _ : state) {
    std::vector<ragrank::FusedResult> out;
    auto s = fusion.Fuse(lists, &out);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(2 * n));
}
BENCHMARK(BM_Fusion_TwoLists)->Range(16, 1024);

static void BM_Aggregate(benchmark::State& state) {
  const size_t subs = static_cast<size_t>(state.range(0));
  ragrank::FusionEngine fusion;
  std::vector<ragrank::SubQuery> sub_queries;
  std::vector<std::vector<ragrank::FusedResult>> fused;
  for (size_t i = 0; i < subs; ++i) {
    sub_queries.push_back({"sub " + std::to_string(i), 1.0, ragrank::SubQueryOrigin::kRule});
    std::vector<ragrank::LabeledList> lists = {
        {"semantic#" + std::to_string(i), MakeList(ragrank::AdapterKind::kSemantic, 30, i * 5)},
        {"lexical#" + std::to_string(i), MakeList(ragrank::AdapterKind::kLexical, 30, i * 7)},
    };
    std::vector<ragrank::FusedResult> out;
    if (!fusion.Fuse(lists, &out).ok()) {
      state.SkipWithError("Fuse failed");
      return;
    }
    fused.push_back(std::move(out));
  }

  ragrank::AggregatorOptions opt;
  opt.method = ragrank::AggregationMethod::kWeighted;
  ragrank::Aggregator aggregator(opt);
  for (auto _ : state) {
    std::vector<ragrank::AggregatedResult> out;
    auto s = aggregator.Aggregate(sub_queries, fused, &out);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_Aggregate)->DenseRange(1, 5);

// =============================================================================
// PART 2: MACROBENCHMARKS - Retriever operations with I/O
// =============================================================================

BENCHMARK_DEFINE_F(RetrieverBenchmark, Index)(benchmark::State& state) {
  if (!retriever_) {
    state.SkipWithError("Open failed");
    return;
  }
  for (auto _ : state) {
    auto s = retriever_->Index(corpus_);
    if (!s.ok()) {
      state.SkipWithError(s.ToString().c_str());
      return;
    }
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(corpus_.size()));
}
BENCHMARK_REGISTER_F(RetrieverBenchmark, Index)->Range(64, 4096);

BENCHMARK_DEFINE_F(RetrieverBenchmark, HybridSearch)(benchmark::State& state) {
  if (!retriever_ || !retriever_->Index(corpus_).ok()) {
    state.SkipWithError("setup failed");
    return;
  }
  ragrank::SearchRequest request;
  request.query = "rust borrow checker and memory allocator";
  request.limit = 10;
  for (auto _ : state) {
    ragrank::SearchResponse response;
    auto s = retriever_->Search(request, &response);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(response);
  }
}
BENCHMARK_REGISTER_F(RetrieverBenchmark, HybridSearch)->Range(64, 4096);

BENCHMARK_DEFINE_F(RetrieverBenchmark, DecomposedSearch)(benchmark::State& state) {
  if (!retriever_ || !retriever_->Index(corpus_).ok()) {
    state.SkipWithError("setup failed");
    return;
  }
  ragrank::SearchRequest request;
  request.query = "rust ownership vs python garbage collector";
  request.decompose = true;
  request.aggregation = ragrank::AggregationMethod::kSum;
  for (auto _ : state) {
    ragrank::SearchResponse response;
    auto s = retriever_->Search(request, &response);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(response);
  }
}
BENCHMARK_REGISTER_F(RetrieverBenchmark, DecomposedSearch)->Range(64, 4096);

}  // namespace

BENCHMARK_MAIN();
