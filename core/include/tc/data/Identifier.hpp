#pragma once
#include <string>

namespace tc {

// "data/tqqq.txt" -> "TQQQ"
std::string symbolFromIdentifier(const std::string& identifier);

// "data/tqqq.txt" -> "data/tqqq_chart.png"
std::string outputPathFor(const std::string& identifier);

} // namespace tc
