#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fencat/errors.hpp"
#include "fencat/options.hpp"
#include "fencat/render.hpp"

static void usage(std::ostream& os, std::string_view exe) {
  os << "fencat reads a FEN string from a file or stdin and prints the chessboard.\n"
     << "The first FEN string found is used; text around it is ignored.\n"
     << "Usage:\n"
     << "  " << exe << " [--flip|-f] [--palette classic|basic] [--glyphs solid|outline|ascii]\n"
     << "         [--active-color always|known|never] [--lenient] [FILE]\n"
     << "       (omit FILE or use '-' to read from stdin)\n"
     << "Examples:\n"
     << "  echo rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR | " << exe << "\n"
     << "  " << exe << " fen.txt\n"
     << "  " << exe << " < fen.txt\n"
     << "  " << exe << " --flip fen.txt\n";
}

static std::string readAll(std::istream& is) {
  std::ostringstream oss;
  oss << is.rdbuf();
  return oss.str();
}

static std::string readInput(const fencat::CliOptions& o) {
  if (!o.file) return readAll(std::cin);
  std::ifstream in(*o.file, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open '" + *o.file + "'");
  return readAll(in);
}

int main(int argc, char** argv) {
  const std::string_view exe = (argc > 0) ? argv[0] : "fencat";
  try {
    const fencat::CliOptions o = fencat::parseOptions(argc, argv);
    for (const auto& w : o.warnings) std::cerr << "warning: " << w << "\n";
    if (o.help) {
      usage(std::cout, exe);
      return 0;
    }

    const std::string text = readInput(o);
    const fencat::Rendering r = fencat::renderFen(text, o.render);
    for (const auto& line : r.lines) std::cout << line << "\n";
    return 0;
  } catch (const fencat::NoFenFound& e) {
    std::cerr << e.what() << "\n";
    usage(std::cerr, exe);
    return 1;
  } catch (const fencat::OptionError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    usage(std::cerr, exe);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
