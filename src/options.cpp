#include "fencat/options.hpp"

#include <array>
#include <cctype>

namespace fencat {

static constexpr std::array<std::string_view, 3> VALUE_KEYS = {"--palette", "--glyphs", "--active-color"};

static std::string toLowerCopy(std::string_view sv) {
  std::string out;
  out.reserve(sv.size());
  for (const char ch : sv) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  return out;
}

static bool takesValue(std::string_view arg) {
  for (const auto k : VALUE_KEYS) {
    if (arg == k) return true;
  }
  return false;
}

std::optional<PaletteId> parsePalette(std::string_view s) {
  const std::string v = toLowerCopy(s);
  if (v == "classic") return PaletteId::Classic;
  if (v == "basic") return PaletteId::Basic;
  return std::nullopt;
}

std::optional<GlyphSet> parseGlyphSet(std::string_view s) {
  const std::string v = toLowerCopy(s);
  if (v == "solid") return GlyphSet::Solid;
  if (v == "outline") return GlyphSet::Outline;
  if (v == "ascii") return GlyphSet::Ascii;
  return std::nullopt;
}

std::optional<ActiveColorLine> parseActiveColorLine(std::string_view s) {
  const std::string v = toLowerCopy(s);
  if (v == "always") return ActiveColorLine::Always;
  if (v == "known") return ActiveColorLine::WhenKnown;
  if (v == "never") return ActiveColorLine::Never;
  return std::nullopt;
}

CliOptions parseOptions(int argc, char** argv) {
  CliOptions o;

  // Single pass, so a flag used as another option's value is read only as that value.
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (takesValue(arg)) {
      if (i + 1 >= argc) throw OptionError("missing value for " + std::string(arg));
      const std::string v = argv[++i];
      if (arg == "--palette") {
        if (auto p = parsePalette(v)) o.render.palette = *p;
        else o.warnings.push_back("unknown --palette '" + v + "', using " + std::string(paletteName(o.render.palette)));
      } else if (arg == "--glyphs") {
        if (auto g = parseGlyphSet(v)) o.render.glyphs = *g;
        else o.warnings.push_back("unknown --glyphs '" + v + "', using " + std::string(glyphSetName(o.render.glyphs)));
      } else {
        if (auto a = parseActiveColorLine(v)) o.render.activeColorLine = *a;
        else o.warnings.push_back("unknown --active-color '" + v + "', using always");
      }
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      o.help = true;
      continue;
    }
    if (arg == "-f" || arg == "--flip") {
      o.render.flip = true;
      continue;
    }
    if (arg == "--lenient") {
      o.render.strictRanks = false;
      continue;
    }
    if (arg.size() > 1 && arg.front() == '-') throw OptionError("unknown option '" + std::string(arg) + "'");

    if (o.file) {
      o.warnings.push_back("ignoring extra argument '" + std::string(arg) + "'");
      continue;
    }
    if (arg != "-") o.file = std::string(arg);
  }

  return o;
}

} // namespace fencat
