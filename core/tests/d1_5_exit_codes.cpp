// D1.5: Error taxonomy to CLI exit codes, including failures outside it

#include "tc/data/Errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <new>
#include <stdexcept>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

// Throw `e`, catch it the way main() does, return the mapped code.
template <typename E>
static int codeOf(const E& e) {
  try {
    throw e;
  } catch (const std::exception& caught) {
    return tc::exitCodeFor(caught);
  }
}

int main() {
  std::printf("=== Typed errors ===\n");
  {
    requireTrue(codeOf(tc::IngestionError("x")) == tc::kExitIngestion, "ingestion -> 2");
    requireTrue(codeOf(tc::DataError("x")) == tc::kExitData, "data -> 3");
    requireTrue(codeOf(tc::EmptySeriesError("x")) == tc::kExitData, "empty series -> 3");
    requireTrue(codeOf(tc::RenderError("x")) == tc::kExitRender, "render -> 4");
    requireTrue(codeOf(tc::ConfigError("x")) == tc::kExitUsage, "config -> 64");
    std::printf("  OK\n");
  }

  std::printf("=== Untyped failures still exit non-zero ===\n");
  {
    requireTrue(codeOf(std::bad_alloc()) == tc::kExitInternal, "bad_alloc -> 1");
    requireTrue(codeOf(std::runtime_error("tls")) == tc::kExitInternal, "runtime_error -> 1");
    requireTrue(codeOf(std::out_of_range("idx")) == tc::kExitInternal, "logic_error -> 1");
    requireTrue(tc::kExitInternal != 0, "non-zero");
    std::printf("  OK\n");
  }

  std::printf("\nD1.5 exit_codes: ALL PASS\n");
  return 0;
}
