// Unit tests for the WordPiece tokenizer

#include <gtest/gtest.h>

#include <ragrank/tokenizer.hpp>

#include <string>
#include <vector>

namespace ragrank::internal {
namespace {

// [PAD]=0 [UNK]=1 [CLS]=2 [SEP]=3 then words and pieces.
std::unique_ptr<WordPieceTokenizer> SmallTokenizer() {
  std::string error;
  auto t = WordPieceTokenizer::FromTokens(
      {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "rust", "borrow", "##ing", "check", "##er", "!", "is",
       "safe"},
      &error);
  EXPECT_NE(t, nullptr) << error;
  return t;
}

TEST(WordPieceTokenizerTest, SpecialTokensResolvedFromVocab) {
  auto t = SmallTokenizer();
  EXPECT_EQ(t->PadTokenId(), 0);
  EXPECT_EQ(t->UnkTokenId(), 1);
  EXPECT_EQ(t->ClsTokenId(), 2);
  EXPECT_EQ(t->SepTokenId(), 3);
  EXPECT_EQ(t->VocabSize(), 12u);
}

TEST(WordPieceTokenizerTest, GreedyLongestMatch) {
  auto t = SmallTokenizer();
  EXPECT_EQ(t->Encode("Borrowing checker!"), (std::vector<int64_t>{5, 6, 7, 8, 9}));
}

TEST(WordPieceTokenizerTest, UnknownWordBecomesUnk) {
  auto t = SmallTokenizer();
  EXPECT_EQ(t->Encode("rust zig"), (std::vector<int64_t>{4, 1}));
  // Partial match with an unmatched tail is unknown as a whole.
  EXPECT_EQ(t->Encode("rustacean"), (std::vector<int64_t>{1}));
}

TEST(WordPieceTokenizerTest, TokenizeWrapsWithClsSep) {
  auto t = SmallTokenizer();
  TokenizerResult r = t->Tokenize("rust is safe");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.input_ids, (std::vector<int64_t>{2, 4, 10, 11, 3}));
  EXPECT_EQ(r.attention_mask, (std::vector<int64_t>(5, 1)));
  EXPECT_EQ(r.token_type_ids, (std::vector<int64_t>(5, 0)));
}

TEST(WordPieceTokenizerTest, TokenizeTruncates) {
  auto t = SmallTokenizer();
  TokenizerResult r = t->Tokenize("rust is safe rust is safe", 4);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.input_ids, (std::vector<int64_t>{2, 4, 10, 3}));
  EXPECT_FALSE(t->Tokenize("rust", 1).success);
}

TEST(WordPieceTokenizerTest, PairUsesSegmentIds) {
  auto t = SmallTokenizer();
  TokenizerResult r = t->TokenizePair("rust", "is safe");
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.input_ids, (std::vector<int64_t>{2, 4, 3, 10, 11, 3}));
  EXPECT_EQ(r.token_type_ids, (std::vector<int64_t>{0, 0, 0, 1, 1, 1}));
}

TEST(WordPieceTokenizerTest, PairTrimsLongerSideFirst) {
  auto t = SmallTokenizer();
  TokenizerResult r = t->TokenizePair("rust", "is safe is safe", 6);
  ASSERT_TRUE(r.success);
  // 3 content slots: query keeps its token, passage keeps two.
  EXPECT_EQ(r.input_ids, (std::vector<int64_t>{2, 4, 3, 10, 11, 3}));
}

TEST(WordPieceTokenizerTest, EmptyVocabularyRejected) {
  std::string error;
  EXPECT_EQ(WordPieceTokenizer::FromTokens({}, &error), nullptr);
  EXPECT_FALSE(error.empty());
}

TEST(WordPieceTokenizerTest, MissingVocabFile) {
  std::string error;
  EXPECT_EQ(WordPieceTokenizer::Create("/nonexistent/vocab.txt", &error), nullptr);
  EXPECT_FALSE(error.empty());
}

}  // namespace
}  // namespace ragrank::internal
