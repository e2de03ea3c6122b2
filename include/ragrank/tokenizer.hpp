#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ragrank::internal {

/**
 * Model input for one sequence: token ids, attention mask and segment ids.
 */
struct TokenizerResult {
  std::vector<int64_t> input_ids;
  std::vector<int64_t> attention_mask;
  std::vector<int64_t> token_type_ids;
  bool success = false;
  std::string error_message;
};

/**
 * WordPiece tokenizer for BERT-family encoders (MiniLM, BGE, BGE reranker).
 * Vocabulary comes from a vocab.txt file, one token per line.
 */
class WordPieceTokenizer {
 public:
  ~WordPieceTokenizer();

  /**
   * @param vocab_path Path to vocab.txt
   * @param error_out Optional error message on failure
   * @return Tokenizer instance, or nullptr on failure
   */
  static std::unique_ptr<WordPieceTokenizer> Create(
      const std::string& vocab_path,
      std::string* error_out = nullptr);

  /** Build directly from tokens in id order (tests, embedded vocabularies). */
  static std::unique_ptr<WordPieceTokenizer> FromTokens(
      const std::vector<std::string>& tokens,
      std::string* error_out = nullptr);

  /** [CLS] text [SEP], truncated to max_length. */
  TokenizerResult Tokenize(std::string_view text, size_t max_length = 512) const;

  /**
   * Cross-encoder input: [CLS] first [SEP] second [SEP] with segment id 0
   * for the first part and 1 for the second. When too long, the longer
   * side is trimmed one token at a time.
   */
  TokenizerResult TokenizePair(std::string_view first,
                               std::string_view second,
                               size_t max_length = 512) const;

  /** Word-piece ids without special tokens. */
  std::vector<int64_t> Encode(std::string_view text) const;

  size_t VocabSize() const { return vocab_.size(); }

  int64_t TokenToId(const std::string& token) const;

  int64_t PadTokenId() const { return pad_token_id_; }
  int64_t UnkTokenId() const { return unk_token_id_; }
  int64_t ClsTokenId() const { return cls_token_id_; }
  int64_t SepTokenId() const { return sep_token_id_; }

 private:
  WordPieceTokenizer() = default;

  bool AddVocab(const std::vector<std::string>& tokens, std::string* error_out);

  // Lowercase, then split on whitespace, punctuation and CJK ideographs.
  std::vector<std::string> SplitWords(std::string_view text) const;

  // Greedy longest-match-first over the vocabulary.
  void AppendWordPieces(const std::string& word, std::vector<int64_t>* ids) const;

  std::unordered_map<std::string, int64_t> vocab_;

  int64_t pad_token_id_ = 0;
  int64_t unk_token_id_ = 100;
  int64_t cls_token_id_ = 101;
  int64_t sep_token_id_ = 102;

  static constexpr size_t kMaxWordLength = 200;
};

}  // namespace ragrank::internal
