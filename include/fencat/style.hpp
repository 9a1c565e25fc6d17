#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "fencat/core.hpp"

namespace fencat {

enum class PaletteId : std::uint8_t { Classic = 0, Basic, Count };
enum class GlyphSet : std::uint8_t { Solid = 0, Outline, Ascii, Count };

constexpr std::string_view RESET = "\x1b[0m";

// SGR sequences for one color scheme. Both foreground tones must stay legible
// on both background tones.
struct Palette {
  std::string_view darkBg;
  std::string_view lightBg;
  std::string_view whiteFg;
  std::string_view blackFg;
};

struct StyleTables {
  std::array<Palette, static_cast<std::size_t>(PaletteId::Count)> palettes{};

  // glyphs[set][color][kind]
  std::array<std::array<std::array<std::string_view, static_cast<std::size_t>(PieceKind::Count)>, 2>,
             static_cast<std::size_t>(GlyphSet::Count)>
      glyphs{};
};

[[nodiscard]] const StyleTables& styleTables();

[[nodiscard]] const Palette& palette(PaletteId id);
[[nodiscard]] std::string_view glyph(GlyphSet set, Piece p);

[[nodiscard]] constexpr std::string_view background(const Palette& pal, Parity parity) {
  return (parity == Parity::Dark) ? pal.darkBg : pal.lightBg;
}

[[nodiscard]] constexpr std::string_view foreground(const Palette& pal, Color c) {
  return (c == Color::White) ? pal.whiteFg : pal.blackFg;
}

[[nodiscard]] constexpr std::string_view paletteName(PaletteId id) {
  switch (id) {
    case PaletteId::Classic: return "classic";
    case PaletteId::Basic: return "basic";
    default: return "?";
  }
}

[[nodiscard]] constexpr std::string_view glyphSetName(GlyphSet set) {
  switch (set) {
    case GlyphSet::Solid: return "solid";
    case GlyphSet::Outline: return "outline";
    case GlyphSet::Ascii: return "ascii";
    default: return "?";
  }
}

} // namespace fencat
