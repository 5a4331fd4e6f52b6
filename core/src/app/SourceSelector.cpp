#include "tc/app/SourceSelector.hpp"
#include "tc/data/CsvFileSource.hpp"
#include "tc/data/Identifier.hpp"
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace tc {

static bool isRegularFile(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

std::unique_ptr<BarSource> selectBarSource(const std::string& identifier,
                                           const RemoteBarSourceConfig& remote) {
  if (isRegularFile(identifier)) {
    return std::make_unique<CsvFileSource>(identifier);
  }
  std::printf("File %s not found. Attempting to download data...\n", identifier.c_str());
  return std::make_unique<RemoteBarSource>(symbolFromIdentifier(identifier), remote);
}

} // namespace tc
