#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fencat/errors.hpp"
#include "fencat/fen.hpp"

using namespace fencat;

static const std::string START = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR";

TEST(FenExtract, BarePlacement) {
  const FenMatch m = extractFen(START);
  EXPECT_EQ(m.placement, START);
  EXPECT_FALSE(m.colorToken.has_value());
  EXPECT_EQ(m.activeColor, ActiveColor::Unknown);
}

TEST(FenExtract, IgnoresGarbageAroundField) {
  const FenMatch m = extractFen("garbage " + START + " w trailing-junk");
  EXPECT_EQ(m.placement, START);
  ASSERT_TRUE(m.colorToken.has_value());
  EXPECT_EQ(*m.colorToken, 'w');
  EXPECT_EQ(m.activeColor, ActiveColor::White);
}

TEST(FenExtract, FullFenResolvesBlackToMove) {
  const FenMatch m = extractFen("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1\n");
  EXPECT_EQ(m.placement, "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR");
  EXPECT_EQ(m.activeColor, ActiveColor::Black);
}

TEST(FenExtract, PrefixGluedToField) {
  const FenMatch m = extractFen("fen:" + START);
  EXPECT_EQ(m.placement, START);
}

TEST(FenExtract, ColorTokenMustBeSeparateField) {
  EXPECT_EQ(extractFen(START + "w").activeColor, ActiveColor::Unknown);
  EXPECT_EQ(extractFen(START + "w").placement, START);
  EXPECT_EQ(extractFen(START + " white").activeColor, ActiveColor::Unknown);
  EXPECT_EQ(extractFen(START + " x w").activeColor, ActiveColor::Unknown);
  EXPECT_EQ(extractFen(START + "\t\tb\n").activeColor, ActiveColor::Black);
  EXPECT_EQ(extractFen(START + " b1").activeColor, ActiveColor::Unknown);
}

TEST(FenExtract, ColorTokenFollowedByPunctuation) {
  const FenMatch quoted = extractFen("[FEN \"" + START + " b\"]");
  EXPECT_EQ(quoted.placement, START);
  EXPECT_EQ(quoted.activeColor, ActiveColor::Black);
  EXPECT_EQ(extractFen(START + " w, then more text").activeColor, ActiveColor::White);
  EXPECT_EQ(extractFen("(" + START + " w)").activeColor, ActiveColor::White);
}

TEST(FenExtract, EmptyInputHasNoFen) {
  EXPECT_THROW((void)extractFen(""), NoFenFound);
}

TEST(FenExtract, UnstructuredInputHasNoFen) {
  EXPECT_THROW((void)extractFen("hello world"), NoFenFound);
  EXPECT_THROW((void)extractFen("a/b/c"), NoFenFound);
  EXPECT_THROW((void)extractFen("8/8/8/8/8/8/8"), NoFenFound);
  EXPECT_THROW((void)extractFen("8/8//8/8/8/8/8/8"), NoFenFound);
}

TEST(FenExtract, DigitNineIsOutsideTheAlphabet) {
  EXPECT_THROW((void)extractFen("8/8/8/9/8/8/8/8"), NoFenFound);
  EXPECT_THROW((void)extractFen("rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w"), NoFenFound);
}

TEST(FenExtract, OnlyFirstFieldIsUsed) {
  const FenMatch m = extractFen("8/8/8/8/8/8/8/8 w\n" + START + " b\n");
  EXPECT_EQ(m.placement, "8/8/8/8/8/8/8/8");
  EXPECT_EQ(m.activeColor, ActiveColor::White);
}

TEST(FenExtract, Idempotent) {
  const std::vector<std::string> inputs = {
      START,
      "garbage " + START + " w trailing-junk",
      "r1bqkbnr/pppp1ppp/2n5/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R b KQkq - 2 3",
      "x 8/8/8/44/8/8/8/8 y",
  };
  for (const auto& in : inputs) {
    const std::string once = extractFen(in).placement;
    EXPECT_EQ(extractFen(once).placement, once) << in;
  }
}

TEST(FenExtract, LongAlphabetRunBeforeField) {
  const std::string noise(100000, 'p');
  const FenMatch m = extractFen(noise + " " + START + " w");
  EXPECT_EQ(m.placement, START);
  EXPECT_EQ(m.activeColor, ActiveColor::White);

  EXPECT_THROW((void)extractFen(noise + "/" + noise), NoFenFound);
}

TEST(FenExtract, MatchPlacementAtReportsLength) {
  const std::string text = "ab " + START + " w";
  EXPECT_EQ(matchPlacementAt(text, 3), START.size());
  EXPECT_EQ(matchPlacementAt(text, 0), 0u);
  EXPECT_EQ(matchPlacementAt(text, 2), 0u);
}

TEST(ColorToken, Parsing) {
  EXPECT_EQ(parseColorToken(" w"), std::optional<char>('w'));
  EXPECT_EQ(parseColorToken("  b  KQkq"), std::optional<char>('b'));
  EXPECT_FALSE(parseColorToken("w").has_value());
  EXPECT_FALSE(parseColorToken(" bx").has_value());
  EXPECT_FALSE(parseColorToken("").has_value());
  EXPECT_FALSE(parseColorToken("   ").has_value());
  EXPECT_EQ(activeColorFromToken(std::nullopt), ActiveColor::Unknown);
}

TEST(RankDecode, EmptyRank) {
  const auto r = decodeRank("8");
  ASSERT_EQ(r.size(), 8u);
  for (const auto& s : r) EXPECT_TRUE(s.isEmpty());
}

TEST(RankDecode, BackRank) {
  const auto r = decodeRank("rnbqkbnr");
  ASSERT_EQ(r.size(), 8u);
  EXPECT_EQ(r[0], Square::occupied({Color::Black, PieceKind::Rook}));
  EXPECT_EQ(r[1], Square::occupied({Color::Black, PieceKind::Knight}));
  EXPECT_EQ(r[2], Square::occupied({Color::Black, PieceKind::Bishop}));
  EXPECT_EQ(r[3], Square::occupied({Color::Black, PieceKind::Queen}));
  EXPECT_EQ(r[4], Square::occupied({Color::Black, PieceKind::King}));
}

TEST(RankDecode, MixedDigitsAndPieces) {
  const auto r = decodeRank("4P3");
  ASSERT_EQ(r.size(), 8u);
  EXPECT_EQ(r[4], Square::occupied({Color::White, PieceKind::Pawn}));
  EXPECT_TRUE(r[3].isEmpty());
  EXPECT_TRUE(r[5].isEmpty());
}

TEST(RankDecode, WellFormedTokensDecodeToEightSquares) {
  for (const char* tok : {"8", "rnbqkbnr", "PPPPPPPP", "4P3", "2n5", "r1bqkb1r", "1p1p1p1p", "7K", "k7", "3Qk3"}) {
    EXPECT_EQ(decodeRank(tok).size(), 8u) << tok;
  }
}

TEST(RankDecode, ConsecutiveDigitsAreSummed) {
  const auto r = decodeRank("44");
  ASSERT_EQ(r.size(), 8u);
  for (const auto& s : r) EXPECT_TRUE(s.isEmpty());
  EXPECT_EQ(decodeRank("1111p111").size(), 8u);
}

TEST(RankDecode, WidthIsNotChecked) {
  EXPECT_EQ(decodeRank("9").size(), 9u);
  EXPECT_EQ(decodeRank("ppp").size(), 3u);
}

TEST(RankDecode, ForeignCharacterIsOneUnknownSquare) {
  const auto r = decodeRank("3x4");
  ASSERT_EQ(r.size(), 8u);
  EXPECT_EQ(r[3].state, SquareState::Unknown);
}

TEST(PieceChars, AllTwelveLettersRoundTrip) {
  for (const char ch : std::string("pnbrqkPNBRQK")) {
    const auto p = pieceFromChar(ch);
    ASSERT_TRUE(p.has_value()) << ch;
    EXPECT_EQ(pieceToChar(*p), ch);
  }
  EXPECT_FALSE(pieceFromChar('x').has_value());
  EXPECT_FALSE(pieceFromChar('1').has_value());
}

TEST(SplitRanks, SplitsOnSlash) {
  const auto parts = splitRanks(START);
  ASSERT_EQ(parts.size(), 8u);
  EXPECT_EQ(parts.front(), "rnbqkbnr");
  EXPECT_EQ(parts[2], "8");
  EXPECT_EQ(parts.back(), "RNBQKBNR");
}
