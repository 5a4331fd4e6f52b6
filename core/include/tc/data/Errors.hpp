#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace tc {

// Source missing or unreadable, malformed columns, empty remote result.
class IngestionError : public std::runtime_error {
public:
  explicit IngestionError(const std::string& msg) : std::runtime_error(msg) {}
};

// Empty series after load or after filtering.
class DataError : public std::runtime_error {
public:
  explicit DataError(const std::string& msg) : std::runtime_error(msg) {}
};

// Nothing left to render.
class EmptySeriesError : public std::runtime_error {
public:
  explicit EmptySeriesError(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid CLI argument or configuration value.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// GL context, shader, font or image write failure.
class RenderError : public std::runtime_error {
public:
  explicit RenderError(const std::string& msg) : std::runtime_error(msg) {}
};

// Process exit codes of the trendchart CLI.
constexpr int kExitInternal = 1;
constexpr int kExitIngestion = 2;
constexpr int kExitData = 3;
constexpr int kExitRender = 4;
constexpr int kExitUsage = 64;

// Exit code for a failure that reached main(). Exceptions outside the
// taxonomy above (std::bad_alloc, library errors) map to kExitInternal.
int exitCodeFor(const std::exception& e);

} // namespace tc
