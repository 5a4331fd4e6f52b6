#pragma once
#include "tc/data/BarSource.hpp"
#include "tc/data/RemoteBarSource.hpp"
#include <memory>
#include <string>

namespace tc {

// A CsvFileSource when `identifier` names an existing regular file,
// otherwise a RemoteBarSource for the ticker derived from it.
std::unique_ptr<BarSource> selectBarSource(const std::string& identifier,
                                           const RemoteBarSourceConfig& remote);

} // namespace tc
