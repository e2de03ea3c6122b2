#include <ragrank/retriever.hpp>

#include <ragrank/chunk_store.hpp>
#include <ragrank/errors.hpp>
#include <ragrank/executor.hpp>
#include <ragrank/fusion.hpp>
#include <ragrank/internal.hpp>
#include <ragrank/llm_decomposer.hpp>
#include <ragrank/text_analyzer.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <shared_mutex>
#include <unordered_map>

namespace ragrank {

namespace {

using internal::Clock;
using internal::EmitCounter;
using internal::EmitGauge;
using internal::EmitHistogram;
using internal::NowMicros;
using internal::SpanAttr;
using internal::SpanEvent;

// Result of one adapter call, produced on a worker thread.
struct AdapterOutcome {
  rocksdb::Status status;
  RankedList list;
  uint64_t latency_us = 0;
};

struct RerankOutcome {
  std::vector<RerankResult> results;
  bool applied = false;
  std::string error;
};

bool IsFiniteNonNegative(double v) { return std::isfinite(v) && v >= 0.0; }

std::string ListId(AdapterKind adapter, size_t sub_query) {
  return std::string(AdapterName(adapter)) + "#" + std::to_string(sub_query);
}

// Best normalised score per adapter, blended with the configured weights.
double CombinedScore(const AggregatedResult& r, double semantic_weight,
                     double keyword_weight) {
  std::optional<double> semantic;
  std::optional<double> lexical;
  for (const auto& a : r.attributions) {
    std::optional<double>& slot = a.adapter == AdapterKind::kSemantic ? semantic : lexical;
    if (!slot || a.normalised_score > *slot) slot = a.normalised_score;
  }
  double combined = 0.0;
  if (semantic) combined += semantic_weight * *semantic;
  if (lexical) combined += keyword_weight * *lexical;
  return combined;
}

}  // namespace

rocksdb::Status ParseSearchMode(std::string_view name, SearchMode* out) {
  const std::string folded = internal::FoldCase(internal::TrimWhitespace(name));
  if (folded == "hybrid") {
    *out = SearchMode::kHybrid;
  } else if (folded == "semantic") {
    *out = SearchMode::kSemantic;
  } else if (folded == "keyword" || folded == "lexical") {
    *out = SearchMode::kKeyword;
  } else {
    return ConfigurationError("unknown search mode: " + std::string(name));
  }
  return rocksdb::Status::OK();
}

std::string_view SearchModeName(SearchMode mode) {
  switch (mode) {
    case SearchMode::kHybrid:
      return "hybrid";
    case SearchMode::kSemantic:
      return "semantic";
    case SearchMode::kKeyword:
      return "keyword";
  }
  return "hybrid";
}

rocksdb::Status ValidateOptions(const Options& opt) {
  if (opt.default_limit == 0) return ConfigurationError("default_limit must be >= 1");
  if (!IsFiniteNonNegative(opt.min_score)) {
    return ConfigurationError("min_score must be finite and >= 0");
  }
  if (opt.candidate_multiplier == 0) {
    return ConfigurationError("candidate_multiplier must be >= 1");
  }
  if (!IsFiniteNonNegative(opt.semantic_weight) || !IsFiniteNonNegative(opt.keyword_weight)) {
    return ConfigurationError("semantic_weight and keyword_weight must be finite and >= 0");
  }

  rocksdb::Status s = FusionEngine(opt.k_rrf).Validate();
  if (!s.ok()) return s;

  DecomposerOptions dopt;
  dopt.strategy = opt.decomposition_strategy;
  dopt.max_sub_queries = opt.max_sub_queries;
  s = QueryDecomposer(dopt).Validate();
  if (!s.ok()) return s;

  s = Aggregator(AggregatorOptions{opt.aggregation, opt.weighted_decay}).Validate();
  if (!s.ok()) return s;

  if (opt.rerank_candidates == 0) return ConfigurationError("rerank_candidates must be >= 1");
  if (opt.rerank_min_score && !std::isfinite(*opt.rerank_min_score)) {
    return ConfigurationError("rerank_min_score must be finite");
  }
  if (opt.filter_overfetch == 0) return ConfigurationError("filter_overfetch must be >= 1");
  if (opt.max_concurrency == 0) return ConfigurationError("max_concurrency must be >= 1");

  if (!opt.custom_vector_backend && opt.vector_backend == VectorBackendType::kHNSW &&
      opt.vector_metric != NativeMetric::kL2 && opt.vector_metric != NativeMetric::kDot) {
    return ConfigurationError("hnsw backend supports only l2 and dot metrics, got " +
                              std::string(MetricName(opt.vector_metric)));
  }
  return rocksdb::Status::OK();
}

Retriever::Retriever(const Options& opt) : opt_(opt) {}

Retriever::~Retriever() { Close(); }

rocksdb::Status Retriever::Open(const std::string& db_path,
                                std::unique_ptr<Retriever>* out,
                                const Options& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->reset();

  rocksdb::Status s = ValidateOptions(opt);
  if (!s.ok()) return s;

  std::unique_ptr<Retriever> r(new Retriever(opt));

  ChunkStoreOptions so;
  so.block_cache_bytes = opt.block_cache_bytes;
  so.bloom_bits_per_key = opt.bloom_bits_per_key;
  so.metrics = opt.metrics;
  s = ChunkStore::Open(db_path, &r->store_, so);
  if (!s.ok()) return s;

  std::string error;

  // Query embedder
  if (opt.custom_embedder) {
    r->embedder_ = opt.custom_embedder;
  } else if (!opt.embedding_model_path.empty()) {
    std::unique_ptr<Embedder> embedder = CreateOnnxEmbedder(
        opt.embedding_model_path, opt.embedding_model_type, opt.inference_threads, &error);
    if (!embedder) return ConfigurationError("failed to load embedder: " + error);
    r->embedder_ = std::move(embedder);
  }

  const size_t stored_dim = r->store_->Dimension();
  if (r->embedder_ && stored_dim != 0 && r->embedder_->Dimension() != stored_dim) {
    return ConfigurationError("embedder dimension " +
                              std::to_string(r->embedder_->Dimension()) +
                              " does not match stored embeddings (" +
                              std::to_string(stored_dim) + ")");
  }

  // Vector backend
  std::shared_ptr<VectorBackend> backend = opt.custom_vector_backend;
  if (!backend) {
    if (opt.vector_backend == VectorBackendType::kExact) {
      backend = CreateExactVectorBackend(r->store_.get(), opt.vector_metric);
    } else {
      const size_t dim = r->embedder_ ? r->embedder_->Dimension() : stored_dim;
      if (dim == 0) {
        return ConfigurationError("hnsw backend needs a known embedding dimension");
      }
      backend = CreateHnswVectorBackend(dim, opt.vector_metric, opt.hnsw, &error);
      if (!backend) return ConfigurationError(error);
      r->rebuild_vector_ = true;
    }
  }
  if (r->embedder_ && backend->Dimension() != 0 &&
      backend->Dimension() != r->embedder_->Dimension()) {
    return ConfigurationError("embedder dimension " +
                              std::to_string(r->embedder_->Dimension()) +
                              " does not match vector backend " + backend->Name() + " (" +
                              std::to_string(backend->Dimension()) + ")");
  }
  r->vector_adapter_ =
      std::make_shared<VectorStoreAdapter>(backend, r->store_.get(), opt.filter_overfetch);

  // Lexical index
  if (opt.custom_lexical_index) {
    r->lexical_ = opt.custom_lexical_index;
  } else {
    std::unique_ptr<LexicalIndex> index = CreateBm25Index(opt.bm25, &error);
    if (!index) return ConfigurationError(error);
    r->lexical_ = std::move(index);
    r->rebuild_lexical_ = true;
  }

  // Cross-encoder: a model that fails to load leaves reranking unavailable
  std::shared_ptr<const CrossEncoder> model = opt.custom_cross_encoder;
  if (!model && !opt.cross_encoder_model_path.empty()) {
    model = CreateCrossEncoder(opt.cross_encoder_model_path, opt.inference_threads, &error);
    if (!model) r->reranker_error_ = "cross-encoder failed to load: " + error;
  }
  if (!model && r->reranker_error_.empty()) r->reranker_error_ = "no cross-encoder configured";
  RerankerOptions ro;
  ro.min_score = opt.rerank_min_score;
  r->reranker_ = std::make_shared<const Reranker>(model, ro);

  // Decomposer: without a generator kLLM uses the rules
  std::shared_ptr<const SubQueryGenerator> generator = opt.custom_sub_query_generator;
  if (!generator && opt.decomposition_strategy == DecompositionStrategy::kLLM &&
      !opt.llm_model_path.empty()) {
    generator = internal::CreateLlamaSubQueryGenerator(opt.llm_model_path,
                                                       opt.inference_threads,
                                                       2048,
                                                       opt.llm_gpu_layers,
                                                       opt.llm_max_tokens,
                                                       &error);
    if (!generator) {
      std::cerr << "ragrank: sub-query generator unavailable, using rules: " << error << "\n";
    }
  }
  DecomposerOptions dopt;
  dopt.strategy = opt.decomposition_strategy;
  dopt.max_sub_queries = opt.max_sub_queries;
  r->decomposer_ = std::make_shared<const QueryDecomposer>(dopt, std::move(generator));

  r->fusion_ = std::make_unique<FusionEngine>(opt.k_rrf);

  s = r->RebuildIndexes();
  if (!s.ok()) return s;

  r->executor_ = std::make_unique<internal::BoundedExecutor>(opt.max_concurrency);

  uint64_t count = 0;
  if (r->store_->Count(&count).ok()) {
    EmitGauge(opt.metrics.get(), "ragrank.index.chunks", static_cast<double>(count));
  }

  *out = std::move(r);
  return rocksdb::Status::OK();
}

rocksdb::Status Retriever::RebuildIndexes() {
  rocksdb::Status inner;

  if (rebuild_vector_) {
    VectorBackend* backend = vector_adapter_->Backend();
    rocksdb::Status s = store_->ForEachEmbedding(
        [&](const std::string& chunk_id, const std::vector<float>& embedding) {
          Chunk chunk;
          chunk.id = chunk_id;
          chunk.embedding = embedding;
          inner = backend->Upsert(chunk);
          return inner.ok();
        });
    if (!s.ok()) return s;
    if (!inner.ok()) return inner;
  }

  if (rebuild_lexical_) {
    rocksdb::Status s = store_->ForEach([&](const Chunk& chunk) {
      inner = lexical_->Add(chunk);
      return inner.ok();
    });
    if (!s.ok()) return s;
    if (!inner.ok()) return inner;
  }
  return rocksdb::Status::OK();
}

size_t Retriever::Dimension() const {
  if (embedder_) return embedder_->Dimension();
  if (store_ && store_->Dimension() != 0) return store_->Dimension();
  return vector_adapter_ ? vector_adapter_->Dimension() : 0;
}

bool Retriever::OpenLocked() const { return store_ && store_->IsOpen() && executor_; }

std::shared_lock<std::shared_mutex> Retriever::EnterCall() const {
  if (closing_.load(std::memory_order_acquire)) return {};
  return std::shared_lock<std::shared_mutex>(lifecycle_mutex_);
}

bool Retriever::IsOpen() const {
  auto life = EnterCall();
  return life.owns_lock() && OpenLocked();
}

rocksdb::Status Retriever::Index(const std::vector<Chunk>& chunks) {
  auto life = EnterCall();
  if (!life.owns_lock() || !OpenLocked()) {
    return rocksdb::Status::InvalidArgument("retriever is closed");
  }
  if (chunks.empty()) return rocksdb::Status::OK();

  MetricsSink* metrics = opt_.metrics.get();
  const uint64_t op_start_us = NowMicros();

  std::vector<Chunk> prepared(chunks);
  const size_t expected = Dimension();
  for (auto& chunk : prepared) {
    if (chunk.id.empty()) chunk.id = MakeChunkId(chunk.source_document_id, chunk.position);
    if (!chunk.embedding.empty() && expected != 0 && chunk.embedding.size() != expected) {
      return ConfigurationError("chunk " + chunk.id + " has embedding dimension " +
                                std::to_string(chunk.embedding.size()) + ", expected " +
                                std::to_string(expected));
    }
  }

  std::lock_guard<std::mutex> lock(write_mutex_);

  rocksdb::Status s = store_->PutBatch(prepared);
  if (!s.ok()) return s;

  // The batch is committed to the store; an index failure from here on
  // leaves the remaining chunks stored but not searchable.
  auto partial = [&](size_t indexed, const rocksdb::Status& cause) {
    EmitCounter(metrics, "ragrank.index.partial_total");
    return rocksdb::Status::IOError(
        "index partially applied",
        std::to_string(indexed) + " of " + std::to_string(prepared.size()) +
            " chunks reached the search indexes, the rest are stored only (" +
            cause.ToString() + ")");
  };

  VectorBackend* backend = vector_adapter_->Backend();
  for (size_t i = 0; i < prepared.size(); ++i) {
    const Chunk& chunk = prepared[i];
    if (chunk.embedding.empty()) {
      s = backend->Remove(chunk.id);
      if (!s.ok() && !s.IsNotFound()) return partial(i, s);
    } else {
      s = backend->Upsert(chunk);
      if (!s.ok()) return partial(i, s);
    }
    s = lexical_->Add(chunk);
    if (!s.ok()) return partial(i, s);
  }

  EmitCounter(metrics, "ragrank.index.chunks_total", prepared.size());
  EmitHistogram(metrics, "ragrank.index.latency_us", NowMicros() - op_start_us);
  return rocksdb::Status::OK();
}

rocksdb::Status Retriever::Remove(std::string_view chunk_id) {
  auto life = EnterCall();
  if (!life.owns_lock() || !OpenLocked()) {
    return rocksdb::Status::InvalidArgument("retriever is closed");
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  rocksdb::Status s = store_->Delete(chunk_id);
  if (!s.ok()) return s;

  const std::string id(chunk_id);
  s = vector_adapter_->Backend()->Remove(id);
  if (!s.ok() && !s.IsNotFound()) return s;
  s = lexical_->Remove(id);
  if (!s.ok() && !s.IsNotFound()) return s;

  EmitCounter(opt_.metrics.get(), "ragrank.remove.chunks_total");
  return rocksdb::Status::OK();
}

rocksdb::Status Retriever::RemoveDocument(std::string_view document_id, uint64_t* removed) {
  if (removed) *removed = 0;
  auto life = EnterCall();
  if (!life.owns_lock() || !OpenLocked()) {
    return rocksdb::Status::InvalidArgument("retriever is closed");
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  std::vector<std::string> ids;
  rocksdb::Status s = store_->ListDocument(document_id, &ids);
  if (!s.ok()) return s;

  uint64_t deleted = 0;
  s = store_->DeleteDocument(document_id, &deleted);
  if (!s.ok()) return s;

  for (const auto& id : ids) {
    s = vector_adapter_->Backend()->Remove(id);
    if (!s.ok() && !s.IsNotFound()) return s;
    s = lexical_->Remove(id);
    if (!s.ok() && !s.IsNotFound()) return s;
  }

  EmitCounter(opt_.metrics.get(), "ragrank.remove.chunks_total", deleted);
  if (removed) *removed = deleted;
  return rocksdb::Status::OK();
}

rocksdb::Status Retriever::Search(const SearchRequest& request,
                                  SearchResponse* response) const {
  if (!response) return rocksdb::Status::InvalidArgument("response is null");
  *response = SearchResponse{};
  auto life = EnterCall();
  if (!life.owns_lock() || !OpenLocked()) {
    return rocksdb::Status::InvalidArgument("retriever is closed");
  }

  MetricsSink* metrics = opt_.metrics.get();
  EmitCounter(metrics, "ragrank.search.calls");
  const uint64_t op_start_us = NowMicros();

  std::unique_ptr<TraceSpan> span;
  if (opt_.tracer) span = opt_.tracer->StartSpan("ragrank.Search");
  TraceSpan* sp = span.get();
  SpanAttr(sp, "mode", SearchModeName(request.mode));

  auto finish = [&](const rocksdb::Status& st) -> rocksdb::Status {
    const uint64_t dur_us = NowMicros() - op_start_us;
    response->latency_us = dur_us;
    EmitHistogram(metrics, "ragrank.search.latency_us", dur_us);
    if (st.ok()) {
      EmitCounter(metrics, "ragrank.search.ok_total");
      EmitHistogram(metrics, "ragrank.search.results", response->results.size());
    } else {
      EmitCounter(metrics, "ragrank.search.error_total");
    }
    if (span) {
      SpanAttr(sp, "sub_queries", static_cast<uint64_t>(response->sub_queries.size()));
      SpanAttr(sp, "results", static_cast<uint64_t>(response->results.size()));
      SpanAttr(sp, "latency_us", dur_us);
      SpanAttr(sp, "status", StatusKind(st));
      span->End(st);
    }
    return st;
  };

  const size_t limit = request.limit > 0 ? request.limit : opt_.default_limit;
  const double min_score = request.min_score.value_or(opt_.min_score);
  if (!IsFiniteNonNegative(min_score)) {
    return finish(ConfigurationError("min_score must be finite and >= 0"));
  }
  const Aggregator aggregator(
      AggregatorOptions{request.aggregation.value_or(opt_.aggregation), opt_.weighted_decay});

  if (request.mode == SearchMode::kSemantic && !SemanticAvailable()) {
    return finish(ConfigurationError("semantic search needs a query embedder"));
  }
  const bool run_semantic = request.mode != SearchMode::kKeyword && SemanticAvailable();
  const bool run_lexical = request.mode != SearchMode::kSemantic;

  const std::string query = internal::TrimWhitespace(request.query);
  if (query.empty()) return finish(rocksdb::Status::OK());

  const uint64_t timeout_ms = request.timeout_ms.value_or(opt_.query_timeout_ms);
  std::optional<Clock::time_point> deadline;
  if (timeout_ms > 0) deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

  // ---------------------------------------------------------------------------
  // Decompose
  // ---------------------------------------------------------------------------
  std::vector<SubQuery> sub_queries;
  if (request.decompose && decomposer_->UsesGenerator()) {
    // The generator gets at most half of the query budget, then rules take over
    std::optional<Clock::time_point> decompose_deadline;
    if (timeout_ms > 0) {
      decompose_deadline = Clock::now() + std::chrono::milliseconds(timeout_ms) / 2;
    }
    auto decomposer = decomposer_;
    auto text = std::make_shared<const std::string>(query);
    std::future<std::vector<SubQuery>> future =
        executor_->Submit([decomposer, text]() { return decomposer->Decompose(*text); });
    if (future.valid() && internal::ReadyBy(future, decompose_deadline)) {
      try {
        sub_queries = future.get();
      } catch (const std::exception& e) {
        std::cerr << "ragrank: sub-query generation failed, using rules: " << e.what() << "\n";
      }
    } else {
      EmitCounter(metrics, "ragrank.decompose.timed_out_total");
      SpanEvent(sp, "decompose.timed_out");
    }
    if (sub_queries.empty()) sub_queries = decomposer_->DecomposeWithRules(query);
  } else if (request.decompose) {
    sub_queries = decomposer_->Decompose(query);
  } else {
    sub_queries.push_back(SubQuery{query, 1.0, SubQueryOrigin::kRule});
  }
  EmitHistogram(metrics, "ragrank.decompose.sub_queries", sub_queries.size());
  SpanAttr(sp, "decompose", request.decompose ? "true" : "false");

  // ---------------------------------------------------------------------------
  // Fan out one task per (sub-query, adapter)
  // ---------------------------------------------------------------------------
  struct Pending {
    size_t sub_query = 0;
    AdapterKind adapter = AdapterKind::kSemantic;
    std::future<AdapterOutcome> future;
  };

  const size_t candidates = limit > std::numeric_limits<size_t>::max() / opt_.candidate_multiplier
                                ? limit
                                : limit * opt_.candidate_multiplier;
  auto filters = std::make_shared<const MetadataFilter>(request.filters);

  std::vector<Pending> pending;
  for (size_t i = 0; i < sub_queries.size(); ++i) {
    auto text = std::make_shared<const std::string>(sub_queries[i].text);

    if (run_semantic) {
      auto embedder = embedder_;
      auto adapter = vector_adapter_;
      pending.push_back(Pending{
          i, AdapterKind::kSemantic,
          executor_->Submit([embedder, adapter, text, filters, candidates]() {
            AdapterOutcome outcome;
            outcome.list = RankedList(AdapterKind::kSemantic);
            const uint64_t start = NowMicros();
            EmbeddingResult embedded = embedder->Embed(*text);
            if (!embedded.success) {
              outcome.status = BackendUnavailable(embedder->ModelName(), embedded.error_message);
            } else {
              outcome.status =
                  adapter->Search(embedded.embedding, candidates, *filters, &outcome.list);
            }
            outcome.latency_us = NowMicros() - start;
            return outcome;
          })});
    }

    if (run_lexical) {
      auto lexical = lexical_;
      pending.push_back(Pending{
          i, AdapterKind::kLexical,
          executor_->Submit([lexical, text, filters, candidates]() {
            AdapterOutcome outcome;
            outcome.list = RankedList(AdapterKind::kLexical);
            const uint64_t start = NowMicros();
            rocksdb::Status s = lexical->Search(*text, candidates, *filters, &outcome.list);
            if (!s.ok() && !IsConfigurationError(s) && !IsBackendUnavailable(s)) {
              s = BackendUnavailable(lexical->Name(), s.ToString());
            }
            outcome.status = s;
            outcome.latency_us = NowMicros() - start;
            return outcome;
          })});
    }
  }

  // ---------------------------------------------------------------------------
  // Collect until the deadline
  // ---------------------------------------------------------------------------
  std::vector<std::vector<LabeledList>> lists(sub_queries.size());
  std::optional<rocksdb::Status> config_error;
  size_t succeeded = 0;
  std::string failures;

  for (auto& p : pending) {
    const std::string_view adapter_name = AdapterName(p.adapter);
    AdapterOutcome outcome;
    if (!p.future.valid()) {
      outcome.status = BackendUnavailable(adapter_name, "executor is stopped");
    } else if (!internal::ReadyBy(p.future, deadline)) {
      outcome.status = DeadlineExceeded(std::string(adapter_name) + " search");
      outcome.latency_us = NowMicros() - op_start_us;
    } else {
      try {
        outcome = p.future.get();
      } catch (const std::exception& e) {
        outcome.status = BackendUnavailable(adapter_name, e.what());
      }
    }

    AdapterStatus status;
    status.sub_query_index = p.sub_query;
    status.adapter = p.adapter;
    status.status = outcome.status;
    status.latency_us = outcome.latency_us;

    EmitHistogram(metrics,
                  p.adapter == AdapterKind::kSemantic ? "ragrank.adapter.semantic.latency_us"
                                                      : "ragrank.adapter.lexical.latency_us",
                  outcome.latency_us);

    if (outcome.status.ok()) {
      ++succeeded;
      status.results = outcome.list.Size();
      outcome.list.SetSubQueryIndex(p.sub_query);
      lists[p.sub_query].push_back(
          LabeledList{ListId(p.adapter, p.sub_query), std::move(outcome.list)});
    } else if (IsConfigurationError(outcome.status)) {
      if (!config_error) config_error = outcome.status;
    } else {
      EmitCounter(metrics, "ragrank.backend.unavailable_total");
      if (outcome.status.IsTimedOut()) EmitCounter(metrics, "ragrank.backend.timed_out_total");
      SpanEvent(sp, "backend_unavailable." + std::string(adapter_name));
      if (!failures.empty()) failures += "; ";
      failures += ListId(p.adapter, p.sub_query) + ": " + outcome.status.ToString();
    }
    response->adapter_statuses.push_back(std::move(status));
  }

  response->sub_queries = sub_queries;
  if (config_error) return finish(*config_error);
  if (succeeded == 0) return finish(NoSearchableBackend(failures));

  // ---------------------------------------------------------------------------
  // Fuse per sub-query, then aggregate
  // ---------------------------------------------------------------------------
  std::vector<std::vector<FusedResult>> fused(sub_queries.size());
  for (size_t i = 0; i < sub_queries.size(); ++i) {
    rocksdb::Status s = fusion_->Fuse(lists[i], &fused[i]);
    if (!s.ok()) return finish(s);
  }

  std::vector<AggregatedResult> aggregated;
  rocksdb::Status s = aggregator.Aggregate(sub_queries, fused, &aggregated);
  if (!s.ok()) return finish(s);

  for (auto& r : aggregated) {
    r.combined_score = CombinedScore(r, opt_.semantic_weight, opt_.keyword_weight);
  }
  if (min_score > 0.0) {
    aggregated.erase(std::remove_if(aggregated.begin(), aggregated.end(),
                                    [min_score](const AggregatedResult& r) {
                                      return r.combined_score < min_score &&
                                             r.aggregate_score < min_score;
                                    }),
                     aggregated.end());
  }

  // Citation fields; chunks removed since they were found are dropped
  const size_t wanted = request.rerank ? std::max(limit, opt_.rerank_candidates) : limit;
  std::vector<AggregatedResult> cited;
  cited.reserve(std::min(wanted, aggregated.size()));
  for (auto& r : aggregated) {
    if (cited.size() >= wanted) break;
    Chunk record;
    s = store_->GetRecord(r.chunk_id, &record);
    if (s.IsNotFound()) continue;
    if (!s.ok()) return finish(s);
    r.text = std::move(record.text);
    r.source_document_id = std::move(record.source_document_id);
    r.position = record.position;
    cited.push_back(std::move(r));
  }

  // ---------------------------------------------------------------------------
  // Rerank
  // ---------------------------------------------------------------------------
  if (request.rerank) {
    std::string reason;
    bool applied = false;
    std::vector<RerankResult> reranked;

    if (!reranker_->Available()) {
      reason = reranker_error_;
    } else if (!cited.empty()) {
      auto candidate_set = std::make_shared<std::vector<RerankCandidate>>();
      candidate_set->reserve(cited.size());
      for (const auto& r : cited) candidate_set->push_back(RerankCandidate{r.chunk_id, r.text});

      auto reranker = reranker_;
      auto text = std::make_shared<const std::string>(query);
      std::future<RerankOutcome> future =
          executor_->Submit([reranker, text, candidate_set, limit]() {
            RerankOutcome outcome;
            outcome.results =
                reranker->Rerank(*text, *candidate_set, limit, &outcome.applied, &outcome.error);
            return outcome;
          });

      if (!future.valid()) {
        reason = "executor is stopped";
      } else if (!internal::ReadyBy(future, deadline)) {
        reason = "deadline exceeded while reranking";
        EmitCounter(metrics, "ragrank.backend.timed_out_total");
      } else {
        try {
          RerankOutcome outcome = future.get();
          applied = outcome.applied;
          reason = std::move(outcome.error);
          reranked = std::move(outcome.results);
        } catch (const std::exception& e) {
          reason = e.what();
        }
      }
    } else {
      reason = "no candidates to rerank";
    }

    if (applied) {
      std::unordered_map<std::string, size_t> index;
      for (size_t i = 0; i < cited.size(); ++i) index.emplace(cited[i].chunk_id, i);

      std::vector<AggregatedResult> reordered;
      reordered.reserve(reranked.size());
      for (const auto& rr : reranked) {
        auto it = index.find(rr.chunk_id);
        if (it == index.end()) continue;
        AggregatedResult r = std::move(cited[it->second]);
        r.rerank_score = rr.score;
        reordered.push_back(std::move(r));
      }
      cited = std::move(reordered);
      response->reranked = true;
      EmitCounter(metrics, "ragrank.rerank.applied_total");
    } else {
      response->rerank_skipped_reason = reason.empty() ? "reranker not applied" : reason;
      EmitCounter(metrics, "ragrank.rerank.skipped_total");
      SpanEvent(sp, "rerank.skipped");
    }
  }

  if (cited.size() > limit) cited.resize(limit);
  response->results = std::move(cited);
  return finish(rocksdb::Status::OK());
}

rocksdb::Status Retriever::Get(std::string_view chunk_id, Chunk* out) const {
  auto life = EnterCall();
  if (!life.owns_lock() || !OpenLocked()) {
    return rocksdb::Status::InvalidArgument("retriever is closed");
  }
  return store_->Get(chunk_id, out);
}

rocksdb::Status Retriever::Count(uint64_t* out) const {
  auto life = EnterCall();
  if (!life.owns_lock() || !OpenLocked()) {
    return rocksdb::Status::InvalidArgument("retriever is closed");
  }
  return store_->Count(out);
}

std::vector<BackendHealth> Retriever::Health() const {
  std::vector<BackendHealth> out;
  auto life = EnterCall();
  if (!life.owns_lock() || !OpenLocked()) {
    BackendHealth closed;
    closed.status = HealthStatus::kUnhealthy;
    closed.backend = "retriever";
    closed.message = "closed";
    out.push_back(closed);
    return out;
  }

  out.push_back(store_->Health());
  out.push_back(vector_adapter_->Health());
  out.push_back(lexical_->Health());

  BackendHealth embedder;
  embedder.backend = "embedder";
  if (embedder_) {
    embedder.message = embedder_->ModelName();
  } else {
    embedder.status = HealthStatus::kDegraded;
    embedder.message = "no query embedder; semantic search disabled";
  }
  out.push_back(embedder);

  BackendHealth reranker;
  reranker.backend = "reranker";
  if (!reranker_->Available()) {
    reranker.status = HealthStatus::kDegraded;
    reranker.message = reranker_error_;
  }
  out.push_back(reranker);
  return out;
}

void Retriever::Close() {
  // Waits for in-flight calls. Workers may still reference the store; stop them first.
  closing_.store(true, std::memory_order_release);
  std::unique_lock<std::shared_mutex> life(lifecycle_mutex_);
  if (executor_) {
    executor_->Shutdown();
    executor_.reset();
  }
  if (store_) store_->Close();
}

}  // namespace ragrank
