#include "parlor/square.hpp"
#include <cctype>

namespace parlor {

static inline bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

static std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

std::optional<Square> parse_square(std::string_view text) {
  const std::string_view t = trim(text);
  if (t.size() != 2) return std::nullopt;

  const char f = static_cast<char>(std::tolower(static_cast<unsigned char>(t[0])));
  const char r = t[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8') return std::nullopt;

  // rank 8 is row 0
  return Square{ '8' - r, f - 'a' };
}

std::string square_name(Square s) {
  std::string out;
  out.reserve(2);
  out.push_back(char('a' + s.col));
  out.push_back(char('8' - s.row));
  return out;
}

} // namespace parlor
