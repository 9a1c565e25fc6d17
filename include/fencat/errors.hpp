#pragma once

#include <stdexcept>
#include <string>

namespace fencat {

class FenError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// No piece-placement field anywhere in the input.
class NoFenFound : public FenError {
public:
  NoFenFound() : FenError("No FEN string provided or not readable.") {}
};

// A rank token whose decoded width is not 8 (strict mode only).
class MalformedRank : public FenError {
public:
  MalformedRank(int rank, int width)
      : FenError("Invalid FEN: rank " + std::to_string(rank) + " has " + std::to_string(width) +
                 " files, expected 8"),
        rank_(rank),
        width_(width) {}

  [[nodiscard]] int rank() const noexcept { return rank_; }
  [[nodiscard]] int width() const noexcept { return width_; }

private:
  int rank_;
  int width_;
};

} // namespace fencat
