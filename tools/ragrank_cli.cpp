#include <ragrank/config.hpp>
#include <ragrank/retriever.hpp>
#include <ragrank/version.hpp>

#include <json/json.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " [-c config.yaml] <db_path|-> index <chunks.jsonl>\n"
      << "  " << argv0 << " [-c config.yaml] <db_path|-> search [options] <query...>\n"
      << "      --mode hybrid|semantic|keyword   --limit N   --decompose   --rerank\n"
      << "      --aggregation max|sum|weighted   --doc <document_id>   --timeout-ms N\n"
      << "  " << argv0 << " [-c config.yaml] <db_path|-> get <chunk_id>\n"
      << "  " << argv0 << " [-c config.yaml] <db_path|-> del <chunk_id>\n"
      << "  " << argv0 << " [-c config.yaml] <db_path|-> del-doc <document_id>\n"
      << "  " << argv0 << " [-c config.yaml] <db_path|-> count\n"
      << "  " << argv0 << " [-c config.yaml] <db_path|-> health\n"
      << "  " << argv0 << " --version\n"
      << "\n"
      << "A db_path of '-' uses db_path from the config file.\n"
      << "chunks.jsonl holds one object per line:\n"
      << "  {\"id\": \"...\", \"text\": \"...\", \"document_id\": \"...\", \"position\": 0,\n"
      << "   \"embedding\": [0.1, ...], \"metadata\": {\"k\": \"v\"}}\n";
}

static bool ParseChunk(const std::string& line, size_t line_no, ragrank::Chunk* out) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(line.data(), line.data() + line.size(), &root, &errors) ||
      !root.isObject()) {
    std::cerr << "line " << line_no << ": invalid JSON object " << errors << "\n";
    return false;
  }
  if (!root["text"].isString() || !root["document_id"].isString()) {
    std::cerr << "line " << line_no << ": 'text' and 'document_id' are required strings\n";
    return false;
  }

  ragrank::Chunk c;
  c.id = root.get("id", "").asString();
  c.text = root["text"].asString();
  c.source_document_id = root["document_id"].asString();
  c.position = root.get("position", 0).asUInt();
  for (const auto& v : root["embedding"]) {
    if (!v.isNumeric()) {
      std::cerr << "line " << line_no << ": embedding values must be numbers\n";
      return false;
    }
    c.embedding.push_back(v.asFloat());
  }
  const Json::Value& meta = root["metadata"];
  if (meta.isObject()) {
    for (const auto& name : meta.getMemberNames()) {
      c.metadata[name] = meta[name].asString();
    }
  }
  *out = std::move(c);
  return true;
}

static Json::Value ResultToJson(const ragrank::AggregatedResult& r, size_t rank) {
  Json::Value out(Json::objectValue);
  out["rank"] = Json::UInt64(rank);
  out["chunk_id"] = r.chunk_id;
  out["document_id"] = r.source_document_id;
  out["position"] = Json::UInt(r.position);
  out["score"] = r.aggregate_score;
  out["combined_score"] = r.combined_score;
  if (r.rerank_score) out["rerank_score"] = *r.rerank_score;
  Json::Value matched(Json::arrayValue);
  for (size_t i : r.matched_sub_queries) matched.append(Json::UInt64(i));
  out["sub_queries"] = matched;
  Json::Value found_by(Json::arrayValue);
  for (const auto& a : r.attributions) {
    found_by.append(std::string(ragrank::AdapterName(a.adapter)) + "#" +
                    std::to_string(a.sub_query_index) + "@" + std::to_string(a.rank));
  }
  out["found_by"] = found_by;
  out["text"] = r.text;
  return out;
}

static const char* HealthName(ragrank::HealthStatus s) {
  switch (s) {
    case ragrank::HealthStatus::kHealthy:
      return "healthy";
    case ragrank::HealthStatus::kDegraded:
      return "degraded";
    case ragrank::HealthStatus::kUnhealthy:
      return "unhealthy";
  }
  return "unknown";
}

int main(int argc, char** argv) {
  if (argc >= 2 && std::string(argv[1]) == "--version") {
    std::cout << "ragrank " << RAGRANK_VERSION_STRING << "\n";
    return 0;
  }

  int arg = 1;
  ragrank::EngineConfig config;
  bool have_config = false;
  if (argc > 2 && std::string(argv[1]) == "-c") {
    try {
      config = ragrank::EngineConfig::LoadFromFile(argv[2]);
    } catch (const std::exception& e) {
      std::cerr << "Config error: " << e.what() << "\n";
      return 1;
    }
    have_config = true;
    arg = 3;
  }
  if (argc - arg < 2) { usage(argv[0]); return 2; }

  std::string db_path = argv[arg];
  const std::string cmd = argv[arg + 1];
  arg += 2;
  if (db_path == "-") {
    if (!have_config) { usage(argv[0]); return 2; }
    db_path = config.db_path;
  } else {
    config.db_path = db_path;
  }

  if (have_config) {
    try {
      config.Validate();
    } catch (const std::exception& e) {
      std::cerr << "Config error: " << e.what() << "\n";
      return 1;
    }
  }

  std::unique_ptr<ragrank::Retriever> retriever;
  auto s = ragrank::Retriever::Open(db_path, &retriever, config.ToOptions());
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  if (cmd == "index") {
    if (argc - arg != 1) { usage(argv[0]); return 2; }
    std::ifstream in(argv[arg]);
    if (!in.is_open()) {
      std::cerr << "Cannot open " << argv[arg] << "\n";
      return 1;
    }

    std::vector<ragrank::Chunk> batch;
    std::string line;
    size_t line_no = 0;
    uint64_t indexed = 0;
    auto flush = [&]() {
      if (batch.empty()) return true;
      s = retriever->Index(batch);
      if (!s.ok()) {
        std::cerr << "Index failed near line " << line_no << ": " << s.ToString() << "\n";
        return false;
      }
      indexed += batch.size();
      batch.clear();
      return true;
    };
    while (std::getline(in, line)) {
      ++line_no;
      if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
      ragrank::Chunk c;
      if (!ParseChunk(line, line_no, &c)) return 1;
      batch.push_back(std::move(c));
      if (batch.size() >= 256 && !flush()) return 1;
    }
    if (!flush()) return 1;
    std::cout << "indexed=" << indexed << "\n";
    return 0;
  } else if (cmd == "search") {
    ragrank::SearchRequest request = config.MakeRequest("");
    std::string query;
    for (; arg < argc; ++arg) {
      const std::string a = argv[arg];
      const bool has_value = arg + 1 < argc;
      if (a == "--mode" && has_value) {
        s = ragrank::ParseSearchMode(argv[++arg], &request.mode);
      } else if (a == "--limit" && has_value) {
        request.limit = std::strtoull(argv[++arg], nullptr, 10);
      } else if (a == "--aggregation" && has_value) {
        ragrank::AggregationMethod m;
        s = ragrank::ParseAggregationMethod(argv[++arg], &m);
        if (s.ok()) request.aggregation = m;
      } else if (a == "--doc" && has_value) {
        request.filters[ragrank::kDocumentIdFilterKey] = argv[++arg];
      } else if (a == "--timeout-ms" && has_value) {
        request.timeout_ms = std::strtoull(argv[++arg], nullptr, 10);
      } else if (a == "--decompose") {
        request.decompose = true;
      } else if (a == "--rerank") {
        request.rerank = true;
      } else {
        if (!query.empty()) query += " ";
        query += a;
      }
      if (!s.ok()) {
        std::cerr << s.ToString() << "\n";
        return 2;
      }
    }
    if (query.empty()) { usage(argv[0]); return 2; }
    request.query = query;

    ragrank::SearchResponse response;
    s = retriever->Search(request, &response);
    if (!s.ok()) {
      std::cerr << "Search failed: " << s.ToString() << "\n";
      return 1;
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    for (size_t i = 0; i < response.results.size(); ++i) {
      std::cout << Json::writeString(writer, ResultToJson(response.results[i], i + 1)) << "\n";
    }
    for (const auto& st : response.adapter_statuses) {
      if (!st.status.ok()) {
        std::cerr << "warning: " << ragrank::AdapterName(st.adapter) << "#" << st.sub_query_index
                  << " left out: " << st.status.ToString() << "\n";
      }
    }
    if (request.rerank && !response.reranked) {
      std::cerr << "warning: rerank skipped: " << response.rerank_skipped_reason << "\n";
    }
    std::cerr << "results=" << response.results.size()
              << " sub_queries=" << response.sub_queries.size()
              << " latency_us=" << response.latency_us << "\n";
    return 0;
  } else if (cmd == "get") {
    if (argc - arg != 1) { usage(argv[0]); return 2; }
    ragrank::Chunk c;
    s = retriever->Get(argv[arg], &c);
    if (!s.ok()) {
      std::cerr << "Get failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "id=" << c.id << "\n"
              << "document_id=" << c.source_document_id << "\n"
              << "position=" << c.position << "\n"
              << "embedding_dim=" << c.embedding.size() << "\n";
    for (const auto& [k, v] : c.metadata) std::cout << "meta." << k << "=" << v << "\n";
    std::cout << c.text << "\n";
    return 0;
  } else if (cmd == "del") {
    if (argc - arg != 1) { usage(argv[0]); return 2; }
    s = retriever->Remove(argv[arg]);
    if (!s.ok() && !s.IsNotFound()) {
      std::cerr << "Delete failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "del-doc") {
    if (argc - arg != 1) { usage(argv[0]); return 2; }
    uint64_t removed = 0;
    s = retriever->RemoveDocument(argv[arg], &removed);
    if (!s.ok()) {
      std::cerr << "Delete failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "removed=" << removed << "\n";
    return 0;
  } else if (cmd == "count") {
    if (argc != arg) { usage(argv[0]); return 2; }
    uint64_t n = 0;
    s = retriever->Count(&n);
    if (!s.ok()) {
      std::cerr << "Count failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "chunks=" << n << "\n";
    return 0;
  } else if (cmd == "health") {
    if (argc != arg) { usage(argv[0]); return 2; }
    int rc = 0;
    for (const auto& h : retriever->Health()) {
      std::cout << h.backend << ": " << HealthName(h.status) << " items=" << h.item_count;
      if (!h.message.empty()) std::cout << " (" << h.message << ")";
      std::cout << "\n";
      if (h.status == ragrank::HealthStatus::kUnhealthy) rc = 1;
    }
    return rc;
  }

  usage(argv[0]);
  return 2;
}
