#include "tc/data/Identifier.hpp"
#include <cctype>

namespace tc {

// Position of the extension dot in the last path component, or npos.
static std::size_t extensionDot(const std::string& path) {
  std::size_t slash = path.find_last_of("/\\");
  std::size_t nameStart = slash == std::string::npos ? 0 : slash + 1;
  std::size_t dot = path.find_last_of('.');
  // A leading dot ("/x/.hidden") is not an extension.
  if (dot == std::string::npos || dot <= nameStart) return std::string::npos;
  return dot;
}

std::string symbolFromIdentifier(const std::string& identifier) {
  std::size_t slash = identifier.find_last_of("/\\");
  std::size_t start = slash == std::string::npos ? 0 : slash + 1;
  std::size_t dot = extensionDot(identifier);
  std::size_t end = dot == std::string::npos ? identifier.size() : dot;
  std::string sym = identifier.substr(start, end - start);
  for (char& c : sym) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return sym;
}

std::string outputPathFor(const std::string& identifier) {
  std::size_t dot = extensionDot(identifier);
  std::string base = dot == std::string::npos ? identifier : identifier.substr(0, dot);
  return base + "_chart.png";
}

} // namespace tc
