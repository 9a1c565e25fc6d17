#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fencat {

constexpr int N = 8;

enum class Color : std::uint8_t { White = 0, Black = 1 };

enum class PieceKind : std::uint8_t { Pawn = 0, Knight, Bishop, Rook, Queen, King, Count };

// Side to move, as read from the optional token after the placement field.
enum class ActiveColor : std::uint8_t { White = 0, Black, Unknown };

struct Piece {
  Color color = Color::White;
  PieceKind kind = PieceKind::Pawn;

  friend constexpr bool operator==(const Piece&, const Piece&) = default;
};

// Unknown is what the rank decoder yields for a character outside the FEN alphabet.
enum class SquareState : std::uint8_t { Empty = 0, Occupied, Unknown };

struct Square {
  SquareState state = SquareState::Empty;
  Piece piece{};

  [[nodiscard]] static constexpr Square empty() { return Square{}; }
  [[nodiscard]] static constexpr Square occupied(Piece p) { return Square{SquareState::Occupied, p}; }
  [[nodiscard]] static constexpr Square unknown() { return Square{SquareState::Unknown, Piece{}}; }

  [[nodiscard]] constexpr bool isEmpty() const { return state == SquareState::Empty; }
  [[nodiscard]] constexpr bool isOccupied() const { return state == SquareState::Occupied; }

  friend constexpr bool operator==(const Square& a, const Square& b) {
    if (a.state != b.state) return false;
    return a.state != SquareState::Occupied || a.piece == b.piece;
  }
};

// Light/dark classification of a square. Always derived from absolute board
// indices (rankIdx 0 = rank 8, fileIdx 0 = file a), never from screen position.
enum class Parity : std::uint8_t { Dark = 0, Light = 1 };

[[nodiscard]] constexpr Parity parityOf(int rankIdx, int fileIdx) {
  return ((rankIdx + fileIdx) % 2 == 0) ? Parity::Dark : Parity::Light;
}

[[nodiscard]] constexpr int rankNumber(int rankIdx) {
  return N - rankIdx; // rankIdx=0 -> 8
}

[[nodiscard]] constexpr char fileLetter(int fileIdx) {
  return static_cast<char>('a' + fileIdx);
}

[[nodiscard]] constexpr bool isPlacementChar(char ch) {
  switch (ch) {
    case 'p': case 'n': case 'b': case 'r': case 'q': case 'k':
    case 'P': case 'N': case 'B': case 'R': case 'Q': case 'K':
      return true;
    default:
      return ch >= '1' && ch <= '8';
  }
}

[[nodiscard]] std::optional<Piece> pieceFromChar(char ch);
[[nodiscard]] char pieceToChar(Piece p);

[[nodiscard]] constexpr std::string_view activeColorName(ActiveColor c) {
  switch (c) {
    case ActiveColor::White: return "White";
    case ActiveColor::Black: return "Black";
    default: return "Unknown";
  }
}

} // namespace fencat
