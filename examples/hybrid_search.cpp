#include <ragrank/retriever.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <vector>

static void PrintResponse(const ragrank::SearchResponse& response) {
  for (size_t i = 0; i < response.sub_queries.size(); ++i) {
    const auto& sq = response.sub_queries[i];
    std::cout << "  sub-query " << i << ": \"" << sq.text << "\" weight=" << sq.weight
              << "\n";
  }
  for (const auto& r : response.results) {
    std::cout << "  " << r.chunk_id << " score=" << r.aggregate_score
              << " doc=" << r.source_document_id << "#" << r.position << "\n";
  }
}

int main() {
  ragrank::Options opt;

  // Keyword-only: no embedder is configured, so hybrid falls back to BM25.
  std::unique_ptr<ragrank::Retriever> db;
  auto s = ragrank::Retriever::Open("./ragrank_db", &db, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  std::vector<ragrank::Chunk> chunks = {
      {"", "Rust ownership moves values between bindings.", "rust-book", 0, {}, {}},
      {"", "The borrow checker rejects dangling references.", "rust-book", 1, {}, {}},
      {"", "Python uses reference counting and a cycle collector.", "python-docs", 0, {}, {}},
      {"", "Go schedules goroutines over OS threads.", "go-tour", 0, {}, {}},
  };
  s = db->Index(chunks);
  if (!s.ok()) {
    std::cerr << "Index failed: " << s.ToString() << "\n";
    return 1;
  }

  ragrank::SearchRequest request;
  request.query = "borrow checker references";
  request.limit = 3;

  ragrank::SearchResponse response;
  s = db->Search(request, &response);
  if (!s.ok()) {
    std::cerr << "Search failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "query: " << request.query << "\n";
  PrintResponse(response);

  // Comparison queries split into one sub-query per side.
  request.query = "rust ownership vs python reference counting";
  request.decompose = true;
  request.aggregation = ragrank::AggregationMethod::kSum;
  s = db->Search(request, &response);
  if (!s.ok()) {
    std::cerr << "Search failed: " << s.ToString() << "\n";
    return 1;
  }
  std::cout << "\nquery: " << request.query << "\n";
  PrintResponse(response);

  uint64_t removed = 0;
  s = db->RemoveDocument("rust-book", &removed);
  if (!s.ok()) std::cerr << "RemoveDocument failed: " << s.ToString() << "\n";
  std::cout << "\nremoved " << removed << " chunks\n";
  return 0;
}
