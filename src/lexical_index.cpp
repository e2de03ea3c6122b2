#include <ragrank/lexical_index.hpp>

#include <ragrank/text_analyzer.hpp>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ragrank {

namespace {

class Bm25Index : public LexicalIndex {
 public:
  explicit Bm25Index(const Bm25Options& opt) : opt_(opt) {}

  std::string Name() const override { return "bm25"; }

  rocksdb::Status Search(const std::string& query,
                         size_t k,
                         const MetadataFilter& filter,
                         RankedList* out) const override {
    if (!out) return rocksdb::Status::InvalidArgument("out is null");
    *out = RankedList(AdapterKind::kLexical);
    if (k == 0) return rocksdb::Status::OK();

    std::vector<std::string> terms = internal::AnalyzeText(query, opt_.drop_stopwords);
    std::sort(terms.begin(), terms.end());
    terms.erase(std::unique(terms.begin(), terms.end()), terms.end());
    if (terms.empty()) return rocksdb::Status::OK();

    std::lock_guard<std::mutex> lock(mutex_);
    if (docs_.empty()) return rocksdb::Status::OK();

    const double n = static_cast<double>(docs_.size());
    const double avg_len =
        total_length_ > 0 ? static_cast<double>(total_length_) / n : 1.0;

    std::unordered_map<std::string, double> scores;
    for (const auto& term : terms) {
      auto it = postings_.find(term);
      if (it == postings_.end()) continue;

      const double df = static_cast<double>(it->second.size());
      const double idf = std::log((n - df + 0.5) / (df + 0.5) + 1.0);

      for (const auto& [chunk_id, tf_count] : it->second) {
        const Doc& doc = docs_.at(chunk_id);
        if (!filter.empty() && !MatchesFilter(doc.record, filter)) continue;

        const double tf = static_cast<double>(tf_count);
        const double len = static_cast<double>(doc.length);
        const double denom = tf + opt_.k1 * (1.0 - opt_.b + opt_.b * len / avg_len);
        scores[chunk_id] += idf * tf * (opt_.k1 + 1.0) / denom;
      }
    }

    std::vector<std::pair<std::string, double>> ranked;
    ranked.reserve(scores.size());
    for (auto& [chunk_id, score] : scores) {
      if (score > 0.0) ranked.emplace_back(chunk_id, score);
    }

    auto better = [](const std::pair<std::string, double>& a,
                     const std::pair<std::string, double>& b) {
      if (a.second != b.second) return a.second > b.second;
      return a.first < b.first;
    };
    if (ranked.size() > k) {
      std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(k),
                        ranked.end(), better);
      ranked.resize(k);
    } else {
      std::sort(ranked.begin(), ranked.end(), better);
    }

    for (auto& [chunk_id, score] : ranked) {
      out->Append(std::move(chunk_id), score, std::min(1.0, score / opt_.saturation));
    }
    return rocksdb::Status::OK();
  }

  rocksdb::Status Add(const Chunk& chunk) override {
    if (chunk.id.empty()) return rocksdb::Status::InvalidArgument("chunk id is empty");

    std::vector<std::string> tokens = internal::AnalyzeText(chunk.text, opt_.drop_stopwords);

    std::lock_guard<std::mutex> lock(mutex_);
    RemoveLocked(chunk.id);

    Doc doc;
    doc.record.id = chunk.id;
    doc.record.source_document_id = chunk.source_document_id;
    doc.record.position = chunk.position;
    doc.record.metadata = chunk.metadata;
    doc.length = static_cast<uint32_t>(tokens.size());

    std::unordered_map<std::string, uint32_t> tf;
    for (auto& token : tokens) ++tf[std::move(token)];
    for (const auto& [term, count] : tf) {
      postings_[term][chunk.id] = count;
      doc.terms.push_back(term);
    }

    total_length_ += doc.length;
    docs_.emplace(chunk.id, std::move(doc));
    return rocksdb::Status::OK();
  }

  rocksdb::Status Remove(const std::string& chunk_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!RemoveLocked(chunk_id)) {
      return rocksdb::Status::NotFound("chunk not in lexical index", chunk_id);
    }
    return rocksdb::Status::OK();
  }

  size_t Size() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return docs_.size();
  }

  BackendHealth Health() const override {
    BackendHealth health;
    health.backend = Name();
    health.item_count = Size();
    return health;
  }

 private:
  struct Doc {
    Chunk record;  // id, document id, position, metadata only
    uint32_t length = 0;
    std::vector<std::string> terms;
  };

  bool RemoveLocked(const std::string& chunk_id) {
    auto it = docs_.find(chunk_id);
    if (it == docs_.end()) return false;

    for (const auto& term : it->second.terms) {
      auto p = postings_.find(term);
      if (p == postings_.end()) continue;
      p->second.erase(chunk_id);
      if (p->second.empty()) postings_.erase(p);
    }
    total_length_ -= it->second.length;
    docs_.erase(it);
    return true;
  }

  Bm25Options opt_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unordered_map<std::string, uint32_t>> postings_;
  std::unordered_map<std::string, Doc> docs_;
  uint64_t total_length_ = 0;
};

}  // namespace

std::unique_ptr<LexicalIndex> CreateBm25Index(const Bm25Options& opt,
                                              std::string* error_out) {
  std::string error;
  if (!(opt.k1 >= 0.0) || !std::isfinite(opt.k1)) {
    error = "bm25 k1 must be a finite value >= 0";
  } else if (!(opt.b >= 0.0 && opt.b <= 1.0)) {
    error = "bm25 b must be in [0, 1]";
  } else if (!(opt.saturation > 0.0) || !std::isfinite(opt.saturation)) {
    error = "bm25 saturation must be a finite value > 0";
  }
  if (!error.empty()) {
    if (error_out) *error_out = error;
    return nullptr;
  }
  return std::make_unique<Bm25Index>(opt);
}

}  // namespace ragrank
