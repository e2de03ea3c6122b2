#pragma once

#include <ragrank/observability.hpp>
#include <ragrank/types.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/status.h>
#include <rocksdb/write_batch.h>

namespace ragrank {

/**
 * Stable chunk id for (document_id, position): the first 16 bytes of
 * SHA-256("document_id\0position"), hex encoded.
 */
std::string MakeChunkId(std::string_view document_id, uint32_t position);

struct ChunkStoreOptions {
  // RocksDB performance knobs
  size_t block_cache_bytes = 64ull * 1024ull * 1024ull;
  int bloom_bits_per_key = 10;

  // Optional metrics (ragrank.store.*)
  std::shared_ptr<MetricsSink> metrics;
};

/**
 * ragrank::ChunkStore
 *
 * RocksDB-backed record of every indexed chunk. Column families:
 *  - ragrank_chunks:     chunk_id -> JSON {text, document_id, position, metadata}
 *  - ragrank_embeddings: chunk_id -> float bytes
 *  - ragrank_documents:  [len:4 BE][document_id][position:4 BE] -> chunk_id
 *
 * The embedding dimension is fixed by the first chunk written and persisted;
 * a chunk with a different dimension is rejected with InvalidArgument.
 *
 * Safe for concurrent readers and writers. Close() must not race with other
 * calls.
 */
class ChunkStore {
 public:
  ~ChunkStore();

  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;

  static rocksdb::Status Open(const std::string& db_path,
                              std::unique_ptr<ChunkStore>* out,
                              const ChunkStoreOptions& opt = ChunkStoreOptions{});

  /** Insert or replace a chunk. */
  rocksdb::Status Put(const Chunk& chunk);

  /** Insert or replace several chunks atomically. */
  rocksdb::Status PutBatch(const std::vector<Chunk>& chunks);

  /** Read a chunk including its embedding. NotFound if absent. */
  rocksdb::Status Get(std::string_view chunk_id, Chunk* out) const;

  /** Read a chunk without its embedding. */
  rocksdb::Status GetRecord(std::string_view chunk_id, Chunk* out) const;

  rocksdb::Status GetEmbedding(std::string_view chunk_id, std::vector<float>* out) const;

  rocksdb::Status Exists(std::string_view chunk_id, bool* exists) const;

  /** Delete one chunk. NotFound if absent. */
  rocksdb::Status Delete(std::string_view chunk_id);

  /** Delete every chunk of a document; deleted may be null. */
  rocksdb::Status DeleteDocument(std::string_view document_id, uint64_t* deleted);

  /** Chunk ids of a document ordered by position. */
  rocksdb::Status ListDocument(std::string_view document_id,
                               std::vector<std::string>* chunk_ids) const;

  rocksdb::Status Count(uint64_t* out) const;

  /** Visit every chunk (with embedding). Return false from the visitor to stop. */
  using ChunkVisitor = std::function<bool(const Chunk&)>;
  rocksdb::Status ForEach(const ChunkVisitor& visitor) const;

  /** Visit every stored embedding. Return false from the visitor to stop. */
  using EmbeddingVisitor =
      std::function<bool(const std::string& chunk_id, const std::vector<float>& embedding)>;
  rocksdb::Status ForEachEmbedding(const EmbeddingVisitor& visitor) const;

  /** Embedding dimension fixed by the first write (0 if nothing written yet). */
  size_t Dimension() const { return dimension_.load(); }

  BackendHealth Health() const;

  bool IsOpen() const { return db_ != nullptr; }

  /** Close the store and release RocksDB resources. Safe to call multiple times. */
  void Close();

 private:
  explicit ChunkStore(const ChunkStoreOptions& opt);

  rocksdb::Status AddToBatch(const Chunk& chunk, rocksdb::WriteBatch* batch,
                             size_t* dimension) const;
  rocksdb::Status ReadRecord(std::string_view chunk_id, Chunk* out) const;

  ChunkStoreOptions opt_;

  rocksdb::DB* db_ = nullptr;
  std::vector<rocksdb::ColumnFamilyHandle*> handles_;
  std::shared_ptr<rocksdb::Cache> block_cache_;

  rocksdb::ColumnFamilyHandle* chunks_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* embeddings_cf_ = nullptr;
  rocksdb::ColumnFamilyHandle* documents_cf_ = nullptr;

  std::atomic<size_t> dimension_{0};
  std::mutex write_mutex_;  // serializes read-modify-write of the document index
};

}  // namespace ragrank
