// Semantic search with cross-encoder reranking
//
// Build with: cmake -DRAGRANK_ENABLE_SEMANTIC=ON ..
//
// Before running, export ONNX models (vocab.txt must sit beside each model):
//   optimum-cli export onnx --model sentence-transformers/all-MiniLM-L6-v2 \
//       --task feature-extraction ./minilm_onnx/
//   optimum-cli export onnx --model cross-encoder/ms-marco-MiniLM-L-6-v2 \
//       --task text-classification ./reranker_onnx/

#include <ragrank/embedder.hpp>
#include <ragrank/retriever.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <embedder.onnx> <cross-encoder.onnx>\n";
    std::cerr << "\nExample:\n";
    std::cerr << "  " << argv[0] << " ./minilm_onnx/model.onnx ./reranker_onnx/model.onnx\n";
    return 1;
  }

  std::string error;
  std::shared_ptr<ragrank::Embedder> embedder =
      ragrank::CreateOnnxEmbedder(argv[1], ragrank::EmbedderModelType::kMiniLM, 0, &error);
  if (!embedder) {
    std::cerr << "Embedder load failed: " << error << "\n";
    return 1;
  }

  ragrank::Options opt;
  opt.custom_embedder = embedder;
  opt.cross_encoder_model_path = argv[2];
  opt.rerank_candidates = 20;

  std::unique_ptr<ragrank::Retriever> db;
  auto s = ragrank::Retriever::Open("./ragrank_semantic_db", &db, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  const std::vector<std::string> texts = {
      "The quick brown fox jumps over the lazy dog.",
      "A fast brown fox leaps above a sleepy dog.",
      "Machine learning is a subset of artificial intelligence.",
      "Gradient descent minimises a loss function step by step.",
  };

  // Chunks are embedded by the caller; the engine only embeds queries.
  std::vector<ragrank::Chunk> chunks;
  for (size_t i = 0; i < texts.size(); ++i) {
    auto e = embedder->Embed(texts[i]);
    if (!e.success) {
      std::cerr << "Embed failed: " << e.error_message << "\n";
      return 1;
    }
    ragrank::Chunk c;
    c.text = texts[i];
    c.source_document_id = "notes";
    c.position = static_cast<uint32_t>(i);
    c.embedding = std::move(e.embedding);
    chunks.push_back(std::move(c));
  }
  s = db->Index(chunks);
  if (!s.ok()) {
    std::cerr << "Index failed: " << s.ToString() << "\n";
    return 1;
  }

  ragrank::SearchRequest request;
  request.query = "how do neural networks learn";
  request.rerank = true;
  request.limit = 3;

  ragrank::SearchResponse response;
  s = db->Search(request, &response);
  if (!s.ok()) {
    std::cerr << "Search failed: " << s.ToString() << "\n";
    return 1;
  }

  if (!response.reranked) {
    std::cout << "(rerank skipped: " << response.rerank_skipped_reason << ")\n";
  }
  for (const auto& r : response.results) {
    std::cout << r.chunk_id << " fused=" << r.aggregate_score;
    if (r.rerank_score) std::cout << " rerank=" << *r.rerank_score;
    std::cout << "\n  " << r.text << "\n";
  }
  return 0;
}
