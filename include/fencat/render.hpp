#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "fencat/board.hpp"
#include "fencat/core.hpp"
#include "fencat/style.hpp"

namespace fencat {

enum class ActiveColorLine : std::uint8_t {
  Always,    // "Active color: Unknown" when no token was found
  WhenKnown,
  Never,
};

struct RenderOptions {
  bool flip = false; // Black's point of view: rank 1 on top, files h..a
  PaletteId palette = PaletteId::Classic;
  GlyphSet glyphs = GlyphSet::Solid;
  ActiveColorLine activeColorLine = ActiveColorLine::Always;
  bool strictRanks = true;
};

// One styled square: background, 3-column cell, foreground when occupied, reset.
[[nodiscard]] std::string renderSquare(const Square& s, Parity parity, const Palette& pal, GlyphSet glyphs);

// Board arranged in display order, before it is joined into lines.
struct Layout {
  std::vector<char> files;                     // left to right
  std::vector<int> rankLabels;                 // top to bottom
  std::vector<std::vector<std::string>> cells; // [row][column], already styled
};

[[nodiscard]] Layout layoutBoard(const Board& board, const RenderOptions& opt);

// Header, 8 rank lines, footer, then the optional active color line.
[[nodiscard]] std::vector<std::string> formatBoard(const Board& board, const RenderOptions& opt);

struct Rendering {
  Board board;
  std::vector<std::string> lines;
};

// Whole pipeline: extract, build, format. Throws NoFenFound / MalformedRank.
[[nodiscard]] Rendering renderFen(std::string_view text, const RenderOptions& opt = {});

} // namespace fencat
