// Wiring ragrank's MetricsSink and Tracer hooks.
//
// Production code would forward these to Prometheus, OpenTelemetry or
// StatsD. Here a search-focused sink keeps per-name totals and prints a
// latency summary; the tracer prints each span when it finishes.

#include <ragrank/retriever.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace {

class SearchMetrics final : public ragrank::MetricsSink {
 public:
  void Counter(std::string_view name, uint64_t delta) override {
    std::lock_guard<std::mutex> lock(mu_);
    counters_[std::string(name)] += delta;
  }

  void Histogram(std::string_view name, uint64_t value) override {
    std::lock_guard<std::mutex> lock(mu_);
    samples_[std::string(name)].push_back(value);
  }

  void Gauge(std::string_view name, double value) override {
    std::lock_guard<std::mutex> lock(mu_);
    gauges_[std::string(name)] = value;
  }

  void Report(std::ostream& os) const {
    std::lock_guard<std::mutex> lock(mu_);
    os << "\ncounters:\n";
    for (const auto& [name, total] : counters_) {
      os << "  " << std::left << std::setw(40) << name << total << "\n";
    }
    os << "gauges:\n";
    for (const auto& [name, value] : gauges_) {
      os << "  " << std::left << std::setw(40) << name << value << "\n";
    }
    os << "histograms (n / p50 / max):\n";
    for (const auto& [name, values] : samples_) {
      std::vector<uint64_t> sorted = values;
      std::sort(sorted.begin(), sorted.end());
      os << "  " << std::left << std::setw(40) << name << sorted.size() << " / "
         << sorted[sorted.size() / 2] << " / " << sorted.back() << "\n";
    }
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, std::vector<uint64_t>> samples_;
};

class PrintingSpan final : public ragrank::TraceSpan {
 public:
  explicit PrintingSpan(std::string_view name)
      : name_(name), started_(std::chrono::steady_clock::now()) {}

  void SetAttribute(std::string_view key, uint64_t value) override {
    line_ += " " + std::string(key) + "=" + std::to_string(value);
  }

  void SetAttribute(std::string_view key, std::string_view value) override {
    line_ += " " + std::string(key) + "=" + std::string(value);
  }

  void AddEvent(std::string_view name) override { line_ += " !" + std::string(name); }

  void End(const rocksdb::Status& status) override {
    const auto took = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started_);
    std::cout << "[" << name_ << " " << took.count() << "us " << status.ToString() << "]"
              << line_ << "\n";
  }

 private:
  std::string name_;
  std::chrono::steady_clock::time_point started_;
  std::string line_;
};

class PrintingTracer final : public ragrank::Tracer {
 public:
  std::unique_ptr<ragrank::TraceSpan> StartSpan(std::string_view name) override {
    return std::make_unique<PrintingSpan>(name);
  }
};

}  // namespace

int main() {
  auto metrics = std::make_shared<SearchMetrics>();

  ragrank::Options opt;
  opt.metrics = metrics;
  opt.tracer = std::make_shared<PrintingTracer>();

  std::unique_ptr<ragrank::Retriever> db;
  auto s = ragrank::Retriever::Open("./ragrank_db", &db, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  std::vector<ragrank::Chunk> chunks = {
      {"obs-0", "RocksDB stores chunks by id.", "notes", 0, {}, {}},
      {"obs-1", "BM25 scores terms by frequency and rarity.", "notes", 1, {}, {}},
  };
  s = db->Index(chunks);
  if (!s.ok()) std::cerr << "Index failed: " << s.ToString() << "\n";

  ragrank::SearchRequest request;
  request.query = "bm25 term frequency";
  ragrank::SearchResponse response;
  s = db->Search(request, &response);
  if (!s.ok()) std::cerr << "Search failed: " << s.ToString() << "\n";

  // Rejected: semantic mode needs an embedder.
  request.mode = ragrank::SearchMode::kSemantic;
  s = db->Search(request, &response);
  std::cout << "semantic without embedder: " << s.ToString() << "\n";

  s = db->Remove("obs-0");
  if (!s.ok()) std::cerr << "Remove failed: " << s.ToString() << "\n";

  metrics->Report(std::cout);
  return 0;
}
