#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "fencat/render.hpp"

namespace fencat {

class OptionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct CliOptions {
  RenderOptions render{};
  std::optional<std::string> file{}; // nullopt (or "-") reads standard input
  bool help = false;
  std::vector<std::string> warnings{};
};

// Throws OptionError for an unknown flag or a flag missing its value.
// Unknown values fall back to the default and are reported in `warnings`.
[[nodiscard]] CliOptions parseOptions(int argc, char** argv);

[[nodiscard]] std::optional<PaletteId> parsePalette(std::string_view s);
[[nodiscard]] std::optional<GlyphSet> parseGlyphSet(std::string_view s);
[[nodiscard]] std::optional<ActiveColorLine> parseActiveColorLine(std::string_view s);

} // namespace fencat
