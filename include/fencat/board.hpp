#pragma once

#include <array>
#include <string>
#include <utility>
#include <vector>

#include "fencat/core.hpp"
#include "fencat/fen.hpp"

namespace fencat {

struct BuildOptions {
  // Reject ranks whose decoded width is not 8 instead of rendering them as-is.
  bool strictRanks = true;
};

class Board {
public:
  using Rank = std::vector<Square>;

  Board() = default;
  Board(std::array<Rank, N> ranks, ActiveColor active) : ranks_(std::move(ranks)), active_(active) {}

  // rankIdx 0 is rank 8 (first FEN token); fileIdx 0 is file a.
  [[nodiscard]] const Rank& rank(int rankIdx) const { return ranks_[static_cast<std::size_t>(rankIdx)]; }
  [[nodiscard]] const Square& at(int rankIdx, int fileIdx) const {
    return ranks_[static_cast<std::size_t>(rankIdx)][static_cast<std::size_t>(fileIdx)];
  }
  [[nodiscard]] int width(int rankIdx) const { return static_cast<int>(rank(rankIdx).size()); }
  [[nodiscard]] ActiveColor activeColor() const { return active_; }

  // Canonical placement string; adjacent empties are merged into one digit.
  [[nodiscard]] std::string placement() const;

private:
  std::array<Rank, N> ranks_{};
  ActiveColor active_ = ActiveColor::Unknown;
};

// Throws MalformedRank when strictRanks is set and a rank is not 8 wide.
[[nodiscard]] Board buildBoard(const FenMatch& match, const BuildOptions& opt = {});

} // namespace fencat
