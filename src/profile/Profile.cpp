#include "instrument-sim/profile/Profile.hpp"

#include <cctype>

namespace instsim {
namespace profile {

namespace {
// Longer indices cannot name a capture and stay verbatim
constexpr std::size_t kMaxCaptureDigits = 9;
} // namespace

std::string substitute_captures(const std::string &text,
                                const std::vector<std::string> &captures) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '$' && i + 1 < text.size() &&
        std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
      std::size_t j = i + 1;
      while (j < text.size() && std::isdigit(static_cast<unsigned char>(text[j])))
        ++j;
      std::size_t index = 0;
      if (j - i - 1 <= kMaxCaptureDigits)
        index = std::stoul(text.substr(i + 1, j - i - 1));
      if (index >= 1 && index <= captures.size()) {
        out += captures[index - 1];
      } else {
        out.append(text, i, j - i);
      }
      i = j;
      continue;
    }
    out += text[i++];
  }
  return out;
}

bool has_placeholders(const std::string &text) {
  for (std::size_t i = 0; i + 1 < text.size(); ++i) {
    if (text[i] == '$' && std::isdigit(static_cast<unsigned char>(text[i + 1])))
      return true;
  }
  return false;
}

} // namespace profile
} // namespace instsim
