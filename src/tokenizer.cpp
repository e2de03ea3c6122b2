#include <ragrank/tokenizer.hpp>

#include <ragrank/text_analyzer.hpp>

#include <fstream>

namespace ragrank::internal {

namespace {

bool IsSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

bool IsAsciiPunct(char c) {
  return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) || (c >= 91 && c <= 96) ||
         (c >= 123 && c <= 126);
}

// CJK Unified Ideographs and compatibility blocks reachable in 3-byte UTF-8.
bool IsCjk(uint32_t cp) {
  return (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
         (cp >= 0xF900 && cp <= 0xFAFF);
}

void Append(TokenizerResult* r, int64_t id, int64_t segment) {
  r->input_ids.push_back(id);
  r->attention_mask.push_back(1);
  r->token_type_ids.push_back(segment);
}

}  // namespace

WordPieceTokenizer::~WordPieceTokenizer() = default;

std::unique_ptr<WordPieceTokenizer> WordPieceTokenizer::Create(
    const std::string& vocab_path,
    std::string* error_out) {
  std::ifstream file(vocab_path);
  if (!file.is_open()) {
    if (error_out) {
      *error_out = "Failed to open vocabulary file: " + vocab_path;
    }
    return nullptr;
  }

  std::vector<std::string> tokens;
  std::string line;
  while (std::getline(file, line)) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' ||
                             line.back() == '\t')) {
      line.pop_back();
    }
    tokens.push_back(line);
  }
  return FromTokens(tokens, error_out);
}

std::unique_ptr<WordPieceTokenizer> WordPieceTokenizer::FromTokens(
    const std::vector<std::string>& tokens,
    std::string* error_out) {
  auto tokenizer = std::unique_ptr<WordPieceTokenizer>(new WordPieceTokenizer());
  if (!tokenizer->AddVocab(tokens, error_out)) {
    return nullptr;
  }
  return tokenizer;
}

bool WordPieceTokenizer::AddVocab(const std::vector<std::string>& tokens,
                                  std::string* error_out) {
  for (size_t i = 0; i < tokens.size(); ++i) {
    // First occurrence wins
    vocab_.emplace(tokens[i], static_cast<int64_t>(i));
  }
  if (vocab_.empty()) {
    if (error_out) {
      *error_out = "Vocabulary is empty";
    }
    return false;
  }

  auto special = [this](const char* token, int64_t fallback) {
    auto it = vocab_.find(token);
    return it != vocab_.end() ? it->second : fallback;
  };
  pad_token_id_ = special("[PAD]", 0);
  unk_token_id_ = special("[UNK]", 100);
  cls_token_id_ = special("[CLS]", 101);
  sep_token_id_ = special("[SEP]", 102);
  return true;
}

int64_t WordPieceTokenizer::TokenToId(const std::string& token) const {
  auto it = vocab_.find(token);
  return it != vocab_.end() ? it->second : unk_token_id_;
}

std::vector<std::string> WordPieceTokenizer::SplitWords(std::string_view text) const {
  const std::string folded = FoldCase(text);
  std::vector<std::string> words;
  std::string current;

  auto flush = [&]() {
    if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  };

  for (size_t i = 0; i < folded.size(); ++i) {
    const char c = folded[i];
    if (IsSpace(c)) {
      flush();
      continue;
    }
    if (IsAsciiPunct(c)) {
      flush();
      words.emplace_back(1, c);
      continue;
    }

    const auto uc = static_cast<unsigned char>(c);
    if ((uc & 0xF0) == 0xE0 && i + 2 < folded.size()) {
      const uint32_t cp = ((uc & 0x0F) << 12) |
                          ((static_cast<unsigned char>(folded[i + 1]) & 0x3F) << 6) |
                          (static_cast<unsigned char>(folded[i + 2]) & 0x3F);
      if (IsCjk(cp)) {
        flush();
        words.push_back(folded.substr(i, 3));
        i += 2;
        continue;
      }
    }
    current.push_back(c);
  }
  flush();
  return words;
}

void WordPieceTokenizer::AppendWordPieces(const std::string& word,
                                          std::vector<int64_t>* ids) const {
  if (word.size() > kMaxWordLength) {
    ids->push_back(unk_token_id_);
    return;
  }

  std::vector<int64_t> pieces;
  size_t start = 0;
  while (start < word.size()) {
    size_t end = word.size();
    int64_t id = -1;
    while (start < end) {
      std::string piece = start > 0 ? "##" + word.substr(start, end - start)
                                    : word.substr(0, end);
      auto it = vocab_.find(piece);
      if (it != vocab_.end()) {
        id = it->second;
        break;
      }
      --end;
    }
    if (id < 0) {
      // Any unmatched remainder makes the whole word unknown.
      ids->push_back(unk_token_id_);
      return;
    }
    pieces.push_back(id);
    start = end;
  }
  ids->insert(ids->end(), pieces.begin(), pieces.end());
}

std::vector<int64_t> WordPieceTokenizer::Encode(std::string_view text) const {
  std::vector<int64_t> ids;
  for (const auto& word : SplitWords(text)) {
    AppendWordPieces(word, &ids);
  }
  return ids;
}

TokenizerResult WordPieceTokenizer::Tokenize(std::string_view text,
                                             size_t max_length) const {
  TokenizerResult result;
  if (max_length < 2) {
    result.error_message = "max_length must be at least 2";
    return result;
  }

  std::vector<int64_t> ids = Encode(text);
  if (ids.size() > max_length - 2) ids.resize(max_length - 2);

  Append(&result, cls_token_id_, 0);
  for (int64_t id : ids) Append(&result, id, 0);
  Append(&result, sep_token_id_, 0);
  result.success = true;
  return result;
}

TokenizerResult WordPieceTokenizer::TokenizePair(std::string_view first,
                                                 std::string_view second,
                                                 size_t max_length) const {
  TokenizerResult result;
  if (max_length < 3) {
    result.error_message = "max_length must be at least 3";
    return result;
  }

  std::vector<int64_t> a = Encode(first);
  std::vector<int64_t> b = Encode(second);
  while (a.size() + b.size() > max_length - 3) {
    if (a.size() > b.size()) {
      a.pop_back();
    } else {
      b.pop_back();
    }
  }

  Append(&result, cls_token_id_, 0);
  for (int64_t id : a) Append(&result, id, 0);
  Append(&result, sep_token_id_, 0);
  for (int64_t id : b) Append(&result, id, 1);
  Append(&result, sep_token_id_, 1);
  result.success = true;
  return result;
}

}  // namespace ragrank::internal
