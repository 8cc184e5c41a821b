#include <iostream>
#include <stdexcept>
#include <string>

#include "galaxis/util/json.h"

#define GALAXIS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

std::string parse_error(const std::string& text) {
  try {
    (void)galaxis::json::parse(text);
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

} // namespace

int test_json_errors() {
  {
    const std::string err = parse_error("{\n  \"a\": 1,\n  ?\n}");
    GALAXIS_ASSERT(err.find("line 3, col 3") != std::string::npos);
    GALAXIS_ASSERT(err.find("expected string key") != std::string::npos);
  }
  {
    const std::string err = parse_error("[1, 2,\n @]");
    GALAXIS_ASSERT(err.find("line 2") != std::string::npos);
    GALAXIS_ASSERT(err.find("unexpected character") != std::string::npos);
  }
  {
    const std::string err = parse_error("{\"planets\": [");
    GALAXIS_ASSERT(err.find("unexpected end of input") != std::string::npos);
  }
  {
    const std::string err = parse_error("{} {}");
    GALAXIS_ASSERT(err.find("trailing characters") != std::string::npos);
  }
  GALAXIS_ASSERT(parse_error("{\"ok\": [true, null, -1.5e2, \"x\\n\"]}").empty());

  return 0;
}
