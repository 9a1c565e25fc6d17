#include "fencat/fen.hpp"

#include <cctype>

#include "fencat/errors.hpp"

namespace fencat {

std::optional<Piece> pieceFromChar(char raw) {
  const bool isWhite = std::isupper(static_cast<unsigned char>(raw)) != 0;
  const char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
  const Color col = isWhite ? Color::White : Color::Black;
  switch (ch) {
    case 'p': return Piece{col, PieceKind::Pawn};
    case 'n': return Piece{col, PieceKind::Knight};
    case 'b': return Piece{col, PieceKind::Bishop};
    case 'r': return Piece{col, PieceKind::Rook};
    case 'q': return Piece{col, PieceKind::Queen};
    case 'k': return Piece{col, PieceKind::King};
    default: return std::nullopt;
  }
}

char pieceToChar(Piece p) {
  char ch = '?';
  switch (p.kind) {
    case PieceKind::Pawn: ch = 'P'; break;
    case PieceKind::Knight: ch = 'N'; break;
    case PieceKind::Bishop: ch = 'B'; break;
    case PieceKind::Rook: ch = 'R'; break;
    case PieceKind::Queen: ch = 'Q'; break;
    case PieceKind::King: ch = 'K'; break;
    default: return '?';
  }
  if (p.color == Color::Black) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return ch;
}

std::size_t matchPlacementAt(std::string_view text, std::size_t pos) {
  std::size_t i = pos;
  for (int group = 0; group < N; ++group) {
    const std::size_t start = i;
    while (i < text.size() && isPlacementChar(text[i])) ++i;
    if (i == start) return 0;
    if (group == N - 1) break;
    if (i >= text.size() || text[i] != '/') return 0;
    ++i;
  }
  return i - pos;
}

std::optional<char> parseColorToken(std::string_view rest) {
  std::size_t i = 0;
  while (i < rest.size() && std::isspace(static_cast<unsigned char>(rest[i]))) ++i;
  // Whitespace before the token; no letter or digit directly after it.
  if (i == 0 || i >= rest.size()) return std::nullopt;
  const char ch = rest[i];
  if (ch != 'w' && ch != 'b') return std::nullopt;
  if (i + 1 < rest.size() && std::isalnum(static_cast<unsigned char>(rest[i + 1]))) return std::nullopt;
  return ch;
}

ActiveColor activeColorFromToken(std::optional<char> token) {
  if (!token) return ActiveColor::Unknown;
  if (*token == 'w') return ActiveColor::White;
  if (*token == 'b') return ActiveColor::Black;
  return ActiveColor::Unknown;
}

FenMatch extractFen(std::string_view text) {
  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    if (!isPlacementChar(text[pos])) continue;
    const std::size_t len = matchPlacementAt(text, pos);
    if (len == 0) {
      // Starting later in the same run only shortens the first group, so skip the run.
      while (pos + 1 < text.size() && isPlacementChar(text[pos + 1])) ++pos;
      continue;
    }

    FenMatch m;
    m.placement = std::string(text.substr(pos, len));
    m.colorToken = parseColorToken(text.substr(pos + len));
    m.activeColor = activeColorFromToken(m.colorToken);
    return m;
  }
  throw NoFenFound();
}

std::vector<Square> decodeRank(std::string_view token) {
  std::vector<Square> out;
  out.reserve(N);
  for (const char raw : token) {
    if (raw >= '1' && raw <= '9') {
      out.insert(out.end(), static_cast<std::size_t>(raw - '0'), Square::empty());
      continue;
    }
    if (const auto p = pieceFromChar(raw)) {
      out.push_back(Square::occupied(*p));
    } else {
      out.push_back(Square::unknown());
    }
  }
  return out;
}

std::vector<std::string_view> splitRanks(std::string_view placement) {
  std::vector<std::string_view> out;
  out.reserve(N);
  std::size_t start = 0;
  for (;;) {
    const std::size_t slash = placement.find('/', start);
    if (slash == std::string_view::npos) {
      out.push_back(placement.substr(start));
      break;
    }
    out.push_back(placement.substr(start, slash - start));
    start = slash + 1;
  }
  return out;
}

} // namespace fencat
