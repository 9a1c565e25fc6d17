#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fencat/core.hpp"

namespace fencat {

struct FenMatch {
  std::string placement;            // the eight slash-separated rank tokens
  std::optional<char> colorToken{}; // 'w' or 'b' when present
  ActiveColor activeColor = ActiveColor::Unknown;
};

// Finds the first piece-placement field in arbitrary text.
// Text before and after the field is ignored. Throws NoFenFound.
[[nodiscard]] FenMatch extractFen(std::string_view text);

// Length of the placement field starting at text[pos], or 0 if none starts there.
[[nodiscard]] std::size_t matchPlacementAt(std::string_view text, std::size_t pos);

// Reads the optional side-to-move token that follows the placement field.
// `rest` is the text immediately after the field.
[[nodiscard]] std::optional<char> parseColorToken(std::string_view rest);

[[nodiscard]] ActiveColor activeColorFromToken(std::optional<char> token);

// Expands one run-length rank token. Width is not checked here.
[[nodiscard]] std::vector<Square> decodeRank(std::string_view token);

[[nodiscard]] std::vector<std::string_view> splitRanks(std::string_view placement);

} // namespace fencat
