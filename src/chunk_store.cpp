#include <ragrank/chunk_store.hpp>

#include <ragrank/internal.hpp>

#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>

#include <json/json.h>

#include <unordered_set>

namespace ragrank {

namespace {

constexpr const char* kChunksCF     = "ragrank_chunks";
constexpr const char* kEmbeddingsCF = "ragrank_embeddings";
constexpr const char* kDocumentsCF  = "ragrank_documents";

constexpr const char* kDimensionKey = "ragrank.embedding_dimension";

inline rocksdb::Slice ToSlice(std::string_view s) {
  return rocksdb::Slice(s.data(), s.size());
}

// Helper: build a ColumnFamilyOptions with shared cache + bloom
rocksdb::ColumnFamilyOptions MakeCFOptions(const std::shared_ptr<rocksdb::Cache>& cache,
                                           int bloom_bits_per_key) {
  rocksdb::BlockBasedTableOptions table;
  table.block_cache = cache;
  table.filter_policy.reset(rocksdb::NewBloomFilterPolicy(bloom_bits_per_key, false));
  table.whole_key_filtering = true;

  rocksdb::ColumnFamilyOptions cfo;
  cfo.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table));
  return cfo;
}

std::string DocumentPrefix(std::string_view document_id) {
  std::string key = internal::EncodeU32BE(static_cast<uint32_t>(document_id.size()));
  key.append(document_id);
  return key;
}

std::string DocumentKey(std::string_view document_id, uint32_t position) {
  return DocumentPrefix(document_id) + internal::EncodeU32BE(position);
}

std::string EncodeRecord(const Chunk& chunk) {
  Json::Value root(Json::objectValue);
  root["text"] = chunk.text;
  root["document_id"] = chunk.source_document_id;
  root["position"] = Json::UInt(chunk.position);

  Json::Value meta(Json::objectValue);
  for (const auto& [key, value] : chunk.metadata) {
    meta[key] = value;
  }
  root["metadata"] = meta;

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, root);
}

rocksdb::Status DecodeRecord(std::string_view chunk_id, std::string_view data, Chunk* out) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(data.data(), data.data() + data.size(), &root, &errors) ||
      !root.isObject()) {
    return rocksdb::Status::Corruption("chunk record is not a JSON object",
                                       std::string(chunk_id));
  }

  out->id = std::string(chunk_id);
  out->text = root.get("text", "").asString();
  out->source_document_id = root.get("document_id", "").asString();
  out->position = root.get("position", 0).asUInt();
  out->metadata.clear();
  const Json::Value& meta = root["metadata"];
  if (meta.isObject()) {
    for (const auto& key : meta.getMemberNames()) {
      out->metadata[key] = meta[key].asString();
    }
  }
  return rocksdb::Status::OK();
}

}  // namespace

std::string MakeChunkId(std::string_view document_id, uint32_t position) {
  std::string material(document_id);
  material.push_back('\0');
  material.append(std::to_string(position));

  std::array<uint8_t, internal::Sha256::kDigestBytes> digest;
  internal::Sha256::Digest(material, &digest);
  return internal::ToHex(digest.data(), 16);
}

ChunkStore::ChunkStore(const ChunkStoreOptions& opt) : opt_(opt) {}

ChunkStore::~ChunkStore() { Close(); }

rocksdb::Status ChunkStore::Open(const std::string& db_path,
                                 std::unique_ptr<ChunkStore>* out,
                                 const ChunkStoreOptions& opt) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  auto store = std::unique_ptr<ChunkStore>(new ChunkStore(opt));

  rocksdb::DBOptions options;
  options.create_if_missing = true;
  options.create_missing_column_families = true;

  // Shared cache for all CFs
  auto cache = rocksdb::NewLRUCache(opt.block_cache_bytes);
  store->block_cache_ = cache;

  std::vector<rocksdb::ColumnFamilyDescriptor> cfs;
  cfs.emplace_back(rocksdb::kDefaultColumnFamilyName, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kChunksCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kEmbeddingsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));
  cfs.emplace_back(kDocumentsCF, MakeCFOptions(cache, opt.bloom_bits_per_key));

  std::vector<rocksdb::ColumnFamilyHandle*> handles;
  rocksdb::DB* db = nullptr;

  rocksdb::Status s = rocksdb::DB::Open(options, db_path, cfs, &handles, &db);
  if (!s.ok()) {
    for (auto* h : handles) delete h;
    return s;
  }

  store->db_ = db;
  store->handles_ = std::move(handles);

  // Descriptor order = handle order
  store->chunks_cf_     = store->handles_[1];
  store->embeddings_cf_ = store->handles_[2];
  store->documents_cf_  = store->handles_[3];

  std::string raw_dim;
  s = db->Get(rocksdb::ReadOptions(), store->handles_[0], kDimensionKey, &raw_dim);
  if (s.ok()) {
    uint32_t dim = 0;
    if (!internal::DecodeU32BE(raw_dim, &dim)) {
      store->Close();
      return rocksdb::Status::Corruption("embedding dimension is not uint32_be");
    }
    store->dimension_.store(dim);
  } else if (!s.IsNotFound()) {
    store->Close();
    return s;
  }

  *out = std::move(store);
  return rocksdb::Status::OK();
}

rocksdb::Status ChunkStore::Put(const Chunk& chunk) {
  return PutBatch({chunk});
}

rocksdb::Status ChunkStore::PutBatch(const std::vector<Chunk>& chunks) {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");
  if (chunks.empty()) return rocksdb::Status::OK();

  std::lock_guard<std::mutex> lock(write_mutex_);

  std::unordered_set<std::string> seen;
  rocksdb::WriteBatch batch;
  const size_t stored_dim = dimension_.load();
  size_t dim = stored_dim;

  for (const auto& chunk : chunks) {
    if (!seen.insert(chunk.id).second) {
      return rocksdb::Status::InvalidArgument("duplicate chunk id in batch", chunk.id);
    }
    rocksdb::Status s = AddToBatch(chunk, &batch, &dim);
    if (!s.ok()) return s;
  }

  if (stored_dim == 0 && dim != 0) {
    batch.Put(handles_[0], kDimensionKey, internal::EncodeU32BE(static_cast<uint32_t>(dim)));
  }

  rocksdb::Status s = db_->Write(rocksdb::WriteOptions(), &batch);
  if (!s.ok()) return s;

  dimension_.store(dim);
  internal::EmitCounter(opt_.metrics.get(), "ragrank.store.put_total", chunks.size());
  return rocksdb::Status::OK();
}

rocksdb::Status ChunkStore::AddToBatch(const Chunk& chunk, rocksdb::WriteBatch* batch,
                                       size_t* dimension) const {
  if (chunk.id.empty()) return rocksdb::Status::InvalidArgument("chunk id is empty");

  if (!chunk.embedding.empty()) {
    if (*dimension == 0) {
      *dimension = chunk.embedding.size();
    } else if (chunk.embedding.size() != *dimension) {
      return rocksdb::Status::InvalidArgument(
          "embedding dimension mismatch: expected " + std::to_string(*dimension) +
              ", got " + std::to_string(chunk.embedding.size()),
          chunk.id);
    }
  }

  // A replaced chunk may have moved within (or between) documents.
  Chunk old;
  rocksdb::Status s = ReadRecord(chunk.id, &old);
  if (s.ok()) {
    batch->Delete(documents_cf_, DocumentKey(old.source_document_id, old.position));
  } else if (!s.IsNotFound()) {
    return s;
  }

  batch->Put(chunks_cf_, chunk.id, EncodeRecord(chunk));
  if (chunk.embedding.empty()) {
    batch->Delete(embeddings_cf_, chunk.id);
  } else {
    batch->Put(embeddings_cf_, chunk.id, internal::SerializeEmbedding(chunk.embedding));
  }
  batch->Put(documents_cf_, DocumentKey(chunk.source_document_id, chunk.position), chunk.id);
  return rocksdb::Status::OK();
}

rocksdb::Status ChunkStore::ReadRecord(std::string_view chunk_id, Chunk* out) const {
  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), chunks_cf_, ToSlice(chunk_id), &raw);
  if (!s.ok()) return s;
  return DecodeRecord(chunk_id, raw, out);
}

rocksdb::Status ChunkStore::Get(std::string_view chunk_id, Chunk* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  rocksdb::Status s = GetRecord(chunk_id, out);
  if (!s.ok()) return s;

  s = GetEmbedding(chunk_id, &out->embedding);
  if (s.IsNotFound()) {
    out->embedding.clear();
    return rocksdb::Status::OK();
  }
  return s;
}

rocksdb::Status ChunkStore::GetRecord(std::string_view chunk_id, Chunk* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  return ReadRecord(chunk_id, out);
}

rocksdb::Status ChunkStore::GetEmbedding(std::string_view chunk_id,
                                         std::vector<float>* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), embeddings_cf_, ToSlice(chunk_id), &raw);
  if (!s.ok()) return s;
  if (!internal::DeserializeEmbedding(raw, out)) {
    return rocksdb::Status::Corruption("embedding length is not a multiple of 4",
                                       std::string(chunk_id));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status ChunkStore::Exists(std::string_view chunk_id, bool* exists) const {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");
  if (!exists) return rocksdb::Status::InvalidArgument("exists is null");

  std::string raw;
  rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), chunks_cf_, ToSlice(chunk_id), &raw);
  if (s.IsNotFound()) {
    *exists = false;
    return rocksdb::Status::OK();
  }
  if (!s.ok()) return s;
  *exists = true;
  return rocksdb::Status::OK();
}

rocksdb::Status ChunkStore::Delete(std::string_view chunk_id) {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");

  std::lock_guard<std::mutex> lock(write_mutex_);

  Chunk old;
  rocksdb::Status s = ReadRecord(chunk_id, &old);
  if (!s.ok()) return s;

  rocksdb::WriteBatch batch;
  batch.Delete(chunks_cf_, ToSlice(chunk_id));
  batch.Delete(embeddings_cf_, ToSlice(chunk_id));
  batch.Delete(documents_cf_, DocumentKey(old.source_document_id, old.position));
  s = db_->Write(rocksdb::WriteOptions(), &batch);
  if (s.ok()) internal::EmitCounter(opt_.metrics.get(), "ragrank.store.delete_total", 1);
  return s;
}

rocksdb::Status ChunkStore::DeleteDocument(std::string_view document_id, uint64_t* deleted) {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");

  std::lock_guard<std::mutex> lock(write_mutex_);

  std::vector<std::string> ids;
  rocksdb::Status s = ListDocument(document_id, &ids);
  if (!s.ok()) return s;

  rocksdb::WriteBatch batch;
  const std::string prefix = DocumentPrefix(document_id);
  for (const auto& id : ids) {
    batch.Delete(chunks_cf_, id);
    batch.Delete(embeddings_cf_, id);
  }
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), documents_cf_));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
      batch.Delete(documents_cf_, it->key());
    }
    if (!it->status().ok()) return it->status();
  }

  s = db_->Write(rocksdb::WriteOptions(), &batch);
  if (!s.ok()) return s;

  if (deleted) *deleted = ids.size();
  internal::EmitCounter(opt_.metrics.get(), "ragrank.store.delete_total", ids.size());
  return rocksdb::Status::OK();
}

rocksdb::Status ChunkStore::ListDocument(std::string_view document_id,
                                         std::vector<std::string>* chunk_ids) const {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");
  if (!chunk_ids) return rocksdb::Status::InvalidArgument("chunk_ids is null");

  chunk_ids->clear();
  const std::string prefix = DocumentPrefix(document_id);
  const rocksdb::Slice prefix_slice(prefix);

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions(), documents_cf_));
  for (it->Seek(prefix_slice); it->Valid() && it->key().starts_with(prefix_slice); it->Next()) {
    chunk_ids->emplace_back(it->value().data(), it->value().size());
  }
  return it->status();
}

rocksdb::Status ChunkStore::Count(uint64_t* out) const {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");
  if (!out) return rocksdb::Status::InvalidArgument("out is null");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  uint64_t count = 0;
  rocksdb::Status iter_status;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, chunks_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      ++count;
    }
    iter_status = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  if (!iter_status.ok()) return iter_status;

  *out = count;
  return rocksdb::Status::OK();
}

rocksdb::Status ChunkStore::ForEach(const ChunkVisitor& visitor) const {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::Status result;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, chunks_cf_));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      Chunk chunk;
      std::string_view id(it->key().data(), it->key().size());
      result = DecodeRecord(id, std::string_view(it->value().data(), it->value().size()), &chunk);
      if (!result.ok()) break;

      std::string raw;
      rocksdb::Status s = db_->Get(ro, embeddings_cf_, it->key(), &raw);
      if (s.ok()) {
        if (!internal::DeserializeEmbedding(raw, &chunk.embedding)) {
          result = rocksdb::Status::Corruption("embedding length is not a multiple of 4", chunk.id);
          break;
        }
      } else if (!s.IsNotFound()) {
        result = s;
        break;
      }

      if (!visitor(chunk)) break;
    }
    if (result.ok()) result = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  return result;
}

rocksdb::Status ChunkStore::ForEachEmbedding(const EmbeddingVisitor& visitor) const {
  if (!db_) return rocksdb::Status::InvalidArgument("store is closed");

  const rocksdb::Snapshot* snapshot = db_->GetSnapshot();
  rocksdb::ReadOptions ro;
  ro.snapshot = snapshot;

  rocksdb::Status result;
  {
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(ro, embeddings_cf_));
    std::vector<float> embedding;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      std::string id(it->key().data(), it->key().size());
      if (!internal::DeserializeEmbedding(
              std::string_view(it->value().data(), it->value().size()), &embedding)) {
        result = rocksdb::Status::Corruption("embedding length is not a multiple of 4", id);
        break;
      }
      if (!visitor(id, embedding)) break;
    }
    if (result.ok()) result = it->status();
  }

  db_->ReleaseSnapshot(snapshot);
  return result;
}

BackendHealth ChunkStore::Health() const {
  BackendHealth health;
  health.backend = "rocksdb_chunk_store";
  if (!db_) {
    health.status = HealthStatus::kUnhealthy;
    health.message = "store is closed";
    return health;
  }

  uint64_t count = 0;
  rocksdb::Status s = Count(&count);
  if (!s.ok()) {
    health.status = HealthStatus::kDegraded;
    health.message = s.ToString();
    return health;
  }
  health.item_count = count;
  return health;
}

void ChunkStore::Close() {
  if (!db_) return;

  for (auto* h : handles_) delete h;
  handles_.clear();
  delete db_;
  db_ = nullptr;
  chunks_cf_ = embeddings_cf_ = documents_cf_ = nullptr;
}

}  // namespace ragrank
