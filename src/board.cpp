#include "fencat/board.hpp"

#include <sstream>

#include "fencat/errors.hpp"

namespace fencat {

std::string Board::placement() const {
  std::ostringstream oss;

  for (int r = 0; r < N; ++r) {
    int empty = 0;
    for (const Square& s : rank(r)) {
      if (s.isEmpty()) {
        ++empty;
        continue;
      }
      if (empty) {
        oss << empty;
        empty = 0;
      }
      oss << (s.isOccupied() ? pieceToChar(s.piece) : '?');
    }
    if (empty) oss << empty;
    if (r != N - 1) oss << '/';
  }

  return oss.str();
}

Board buildBoard(const FenMatch& match, const BuildOptions& opt) {
  const auto tokens = splitRanks(match.placement);
  if (tokens.size() != static_cast<std::size_t>(N)) {
    throw FenError("Invalid FEN: expected 8 ranks, found " + std::to_string(tokens.size()));
  }

  std::array<Board::Rank, N> ranks;
  for (int r = 0; r < N; ++r) {
    ranks[static_cast<std::size_t>(r)] = decodeRank(tokens[static_cast<std::size_t>(r)]);
    const int width = static_cast<int>(ranks[static_cast<std::size_t>(r)].size());
    if (opt.strictRanks && width != N) throw MalformedRank(rankNumber(r), width);
  }

  return Board(std::move(ranks), match.activeColor);
}

} // namespace fencat
