#include "fencat/style.hpp"

namespace fencat {

static constexpr std::size_t idx(PaletteId id) { return static_cast<std::size_t>(id); }
static constexpr std::size_t idx(GlyphSet set) { return static_cast<std::size_t>(set); }
static constexpr std::size_t idx(Color c) { return static_cast<std::size_t>(c); }

static StyleTables buildStyleTables() {
  StyleTables t{};

  // xterm-256 greys; default scheme.
  t.palettes[idx(PaletteId::Classic)] = Palette{
      "\x1b[48;5;246m",
      "\x1b[48;5;249m",
      "\x1b[38;5;231m",
      "\x1b[38;5;0m",
  };
  // 16-color fallback for terminals without the 256-color extension.
  t.palettes[idx(PaletteId::Basic)] = Palette{
      "\x1b[100m",
      "\x1b[47m",
      "\x1b[97m",
      "\x1b[30m",
  };

  // Order follows PieceKind: pawn, knight, bishop, rook, queen, king.
  // U+FE0E keeps the pawn in text presentation; some fonts draw it as emoji otherwise.
  const std::array<std::string_view, 6> filled = {
      "\u265F\uFE0E", "♞", "♝", "♜", "♛", "♚",
  };
  const std::array<std::string_view, 6> hollow = {
      "♙", "♘", "♗", "♖", "♕", "♔",
  };

  t.glyphs[idx(GlyphSet::Solid)][idx(Color::White)] = filled;
  t.glyphs[idx(GlyphSet::Solid)][idx(Color::Black)] = filled;

  t.glyphs[idx(GlyphSet::Outline)][idx(Color::White)] = hollow;
  t.glyphs[idx(GlyphSet::Outline)][idx(Color::Black)] = filled;

  t.glyphs[idx(GlyphSet::Ascii)][idx(Color::White)] = {"P", "N", "B", "R", "Q", "K"};
  t.glyphs[idx(GlyphSet::Ascii)][idx(Color::Black)] = {"p", "n", "b", "r", "q", "k"};

  return t;
}

const StyleTables& styleTables() {
  static const StyleTables t = buildStyleTables();
  return t;
}

const Palette& palette(PaletteId id) {
  const auto& pals = styleTables().palettes;
  if (idx(id) >= pals.size()) return pals[idx(PaletteId::Classic)];
  return pals[idx(id)];
}

std::string_view glyph(GlyphSet set, Piece p) {
  const auto& t = styleTables().glyphs;
  const auto kind = static_cast<std::size_t>(p.kind);
  if (idx(set) >= t.size() || kind >= static_cast<std::size_t>(PieceKind::Count)) return {};
  return t[idx(set)][idx(p.color)][kind];
}

} // namespace fencat
