#include <ragrank/vector_index.hpp>

#ifdef RAGRANK_ENABLE_SEMANTIC

#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ragrank::internal {

// HNSW implementation using hnswlib
class HNSWIndex : public VectorIndex {
 public:
  HNSWIndex(size_t dimension, HnswSpace space, size_t max_elements, int m,
            int ef_construction)
      : dimension_(dimension),
        space_kind_(space),
        max_elements_(std::max<size_t>(max_elements, 16)),
        ef_search_(50) {
    if (space == HnswSpace::kInnerProduct) {
      space_ = std::make_unique<hnswlib::InnerProductSpace>(dimension);
    } else {
      space_ = std::make_unique<hnswlib::L2Space>(dimension);
    }
    index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(), max_elements_, m, ef_construction);
    index_->setEf(ef_search_);
  }

  bool Add(const std::vector<float>& embedding,
           const std::string& chunk_id) override {
    std::lock_guard<std::mutex> lock(mutex_);

    if (embedding.size() != dimension_) {
      return false;
    }

    // Replacing: retire the old label first
    auto existing = chunk_id_to_label_.find(chunk_id);
    if (existing != chunk_id_to_label_.end()) {
      RemoveLocked(existing->second);
    }

    // Grow index if needed
    if (next_label_ >= max_elements_) {
      size_t new_max = max_elements_ * 2;
      try {
        index_->resizeIndex(new_max);
      } catch (const std::exception&) {
        return false;
      }
      max_elements_ = new_max;
    }

    hnswlib::labeltype label = next_label_;
    try {
      index_->addPoint(embedding.data(), label);
    } catch (const std::exception&) {
      return false;
    }

    label_to_chunk_id_[label] = chunk_id;
    chunk_id_to_label_[chunk_id] = label;
    next_label_++;
    return true;
  }

  bool Search(const std::vector<float>& query,
              size_t k,
              std::vector<SearchResult>* out,
              std::string* error_out) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    out->clear();

    if (query.size() != dimension_ || k == 0 || label_to_chunk_id_.empty()) {
      return true;
    }

    size_t search_k = std::min(k, label_to_chunk_id_.size());
    // ef below k silently caps recall
    if (static_cast<size_t>(ef_search_) < search_k) {
      index_->setEf(search_k);
    }

    std::priority_queue<std::pair<float, hnswlib::labeltype>> result;
    try {
      result = index_->searchKnn(query.data(), search_k);
    } catch (const std::exception& e) {
      index_->setEf(ef_search_);
      if (error_out) *error_out = std::string("searchKnn failed: ") + e.what();
      return false;
    }
    index_->setEf(ef_search_);

    out->reserve(result.size());
    while (!result.empty()) {
      auto [distance, label] = result.top();
      result.pop();

      auto it = label_to_chunk_id_.find(label);
      if (it != label_to_chunk_id_.end()) {
        out->push_back({it->second, distance});
      }
    }

    // Results come from priority queue (max-heap), so reverse for ascending order
    std::reverse(out->begin(), out->end());
    return true;
  }

  bool Remove(const std::string& chunk_id) override {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = chunk_id_to_label_.find(chunk_id);
    if (it == chunk_id_to_label_.end()) {
      return false;
    }
    RemoveLocked(it->second);
    return true;
  }

  size_t Size() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return label_to_chunk_id_.size();
  }

  size_t Dimension() const override { return dimension_; }

  size_t DeletedCount() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return deleted_count_;
  }

  HnswSpace Space() const override { return space_kind_; }

  void SetSearchParam(const std::string& key, int value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if ((key == "ef_search" || key == "ef") && value > 0) {
      ef_search_ = value;
      index_->setEf(value);
    }
  }

 private:
  // Caller must hold mutex
  void RemoveLocked(hnswlib::labeltype label) {
    try {
      index_->markDelete(label);
    } catch (const std::exception&) {
      // Already marked; the mappings below are still authoritative.
    }
    auto it = label_to_chunk_id_.find(label);
    if (it != label_to_chunk_id_.end()) {
      chunk_id_to_label_.erase(it->second);
      label_to_chunk_id_.erase(it);
    }
    deleted_count_++;
  }

  size_t dimension_;
  HnswSpace space_kind_;
  size_t max_elements_;
  int ef_search_;

  std::unique_ptr<hnswlib::SpaceInterface<float>> space_;
  std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;

  std::unordered_map<hnswlib::labeltype, std::string> label_to_chunk_id_;
  std::unordered_map<std::string, hnswlib::labeltype> chunk_id_to_label_;

  size_t next_label_ = 0;
  size_t deleted_count_ = 0;
  mutable std::mutex mutex_;
};

std::unique_ptr<VectorIndex> CreateHNSWIndex(
    size_t dimension,
    HnswSpace space,
    size_t max_elements,
    int m,
    int ef_construction) {
  if (dimension == 0) return nullptr;
  return std::make_unique<HNSWIndex>(dimension, space, max_elements, m, ef_construction);
}

}  // namespace ragrank::internal

#else  // !RAGRANK_ENABLE_SEMANTIC

namespace ragrank::internal {

std::unique_ptr<VectorIndex> CreateHNSWIndex(size_t, HnswSpace, size_t, int, int) {
  return nullptr;
}

}  // namespace ragrank::internal

#endif  // RAGRANK_ENABLE_SEMANTIC
