#include "fencat/render.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "fencat/fen.hpp"

namespace fencat {

std::string renderSquare(const Square& s, Parity parity, const Palette& pal, GlyphSet glyphs) {
  std::string out(background(pal, parity));

  switch (s.state) {
    case SquareState::Empty:
      out += "   ";
      break;
    case SquareState::Occupied: {
      const std::string_view g = glyph(glyphs, s.piece);
      if (g.empty()) {
        out += ' ';
        break;
      }
      out += foreground(pal, s.piece.color);
      out += ' ';
      out += g;
      out += ' ';
      break;
    }
    default:
      out += ' ';
      break;
  }

  // Keeps the colors off the separator and the line terminator.
  out += RESET;
  return out;
}

Layout layoutBoard(const Board& board, const RenderOptions& opt) {
  const Palette& pal = palette(opt.palette);
  Layout l;

  for (int f = 0; f < N; ++f) l.files.push_back(fileLetter(f));
  if (opt.flip) std::reverse(l.files.begin(), l.files.end());

  for (int row = 0; row < N; ++row) {
    const int r = opt.flip ? (N - 1 - row) : row;
    l.rankLabels.push_back(opt.flip ? row + 1 : N - row);

    std::vector<std::string> cells;
    const int width = board.width(r);
    cells.reserve(static_cast<std::size_t>(width));
    for (int col = 0; col < width; ++col) {
      const int f = opt.flip ? (width - 1 - col) : col;
      cells.push_back(renderSquare(board.at(r, f), parityOf(r, f), pal, opt.glyphs));
    }
    l.cells.push_back(std::move(cells));
  }

  return l;
}

std::vector<std::string> formatBoard(const Board& board, const RenderOptions& opt) {
  const Layout l = layoutBoard(board, opt);
  std::vector<std::string> lines;
  lines.reserve(N + 3);

  std::string header = " ";
  for (const char f : l.files) {
    header += "  ";
    header += f;
  }
  lines.push_back(header);

  for (std::size_t row = 0; row < l.cells.size(); ++row) {
    std::ostringstream oss;
    oss << l.rankLabels[row] << ' ';
    for (const auto& cell : l.cells[row]) oss << cell;
    oss << ' ' << l.rankLabels[row];
    lines.push_back(oss.str());
  }

  lines.push_back(header);

  const ActiveColor active = board.activeColor();
  const bool showActive = opt.activeColorLine == ActiveColorLine::Always ||
                          (opt.activeColorLine == ActiveColorLine::WhenKnown && active != ActiveColor::Unknown);
  if (showActive) lines.push_back("Active color: " + std::string(activeColorName(active)));

  return lines;
}

Rendering renderFen(std::string_view text, const RenderOptions& opt) {
  const FenMatch m = extractFen(text);
  BuildOptions bo;
  bo.strictRanks = opt.strictRanks;

  Rendering out;
  out.board = buildBoard(m, bo);
  out.lines = formatBoard(out.board, opt);
  return out;
}

} // namespace fencat
