#pragma once

#include <ragrank/retriever.hpp>

#include <string>

namespace ragrank {

/**
 * File-backed engine configuration.
 *
 * Format (YAML subset):
 *   db_path: /data/ragrank
 *   retrieval:
 *     default_limit: 10
 *     mode: hybrid
 *   fusion:
 *     k_rrf: 60
 *
 * Sections: store, retrieval, fusion, decomposition, reranker, embedding,
 * hnsw, concurrency. Unknown keys are rejected.
 */
struct EngineConfig {
  std::string db_path;
  SearchMode default_mode = SearchMode::kHybrid;
  bool default_decompose = false;
  bool default_rerank = false;
  Options options;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static EngineConfig LoadFromFile(const std::string& path);

  /**
   * Parse configuration text (same format as LoadFromFile).
   * @throws std::runtime_error on malformed lines, unknown keys or bad values.
   */
  static EngineConfig Parse(const std::string& text);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  /** Retriever options (hooks left unset). */
  Options ToOptions() const { return options; }

  /** A request carrying the configured defaults. */
  SearchRequest MakeRequest(const std::string& query) const;
};

}  // namespace ragrank
