#pragma once

#include <ragrank/types.hpp>

#include <cstddef>
#include <memory>
#include <string>

#include <rocksdb/status.h>

namespace ragrank {

/**
 * Term-based ranking over chunk text.
 *
 * Search() returns only chunks sharing at least one term with the query;
 * chunks with zero score are left out so the list stays dense. Normalised
 * scores lie in [0, 1]. Implementations must be safe for concurrent use.
 * An unreachable index returns IOError.
 */
class LexicalIndex {
 public:
  virtual ~LexicalIndex() = default;

  virtual std::string Name() const = 0;

  virtual rocksdb::Status Search(const std::string& query,
                                 size_t k,
                                 const MetadataFilter& filter,
                                 RankedList* out) const = 0;

  /** Index chunk text, replacing any earlier entry with the same id. */
  virtual rocksdb::Status Add(const Chunk& chunk) = 0;

  /** NotFound if the chunk is not indexed. */
  virtual rocksdb::Status Remove(const std::string& chunk_id) = 0;

  virtual size_t Size() const = 0;

  virtual BackendHealth Health() const = 0;
};

struct Bm25Options {
  double k1 = 1.2;           // term frequency saturation
  double b = 0.75;           // length normalisation
  double saturation = 10.0;  // raw score mapped to normalised 1.0
  bool drop_stopwords = true;
};

/**
 * In-memory Okapi BM25 index.
 *
 *   idf(t)   = ln((N - df + 0.5) / (df + 0.5) + 1)
 *   score(d) = sum over query terms of idf * tf * (k1 + 1) /
 *              (tf + k1 * (1 - b + b * len / avg_len))
 *   normalised = min(1, score / saturation)
 *
 * Returns nullptr with error_out set if the options are invalid.
 */
std::unique_ptr<LexicalIndex> CreateBm25Index(const Bm25Options& opt = Bm25Options{},
                                              std::string* error_out = nullptr);

}  // namespace ragrank
