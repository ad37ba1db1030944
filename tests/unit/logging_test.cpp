#include "internal/observability/logging.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

using ure::observability::BoolField;
using ure::observability::IntField;
using ure::observability::StringField;

// Routes the default logger into `out` with a bare message pattern.
void CaptureInto(std::ostringstream& out) {
  auto sink   = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
  auto logger = std::make_shared<spdlog::logger>("ure-engine-test", sink);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(logger);
}

void TestFieldHelpersRenderValues() {
  assert(StringField("uri", "a.md").value == "a.md");
  assert(IntField("status", -3).value == "-3");
  assert(BoolField("new", true).value == "true");
  assert(BoolField("new", false).value == "false");
  assert(BoolField("new", false).key == "new");
}

void TestLinesCarryKeyValueFields() {
  std::ostringstream out;
  CaptureInto(out);

  URE_LOG_INFO("resource admitted", {StringField("uri", "docs/a b.md"), IntField("size", 12), BoolField("new", true)});
  spdlog::default_logger()->flush();

  const auto line = out.str();
  assert(line.find("resource admitted") == 0);
  assert(line.find("uri=\"docs/a b.md\"") != std::string::npos);
  assert(line.find("size=12") != std::string::npos);
  assert(line.find("new=true") != std::string::npos);
}

void TestLevelFiltersBeforeFormatting() {
  std::ostringstream out;
  CaptureInto(out);
  spdlog::default_logger()->set_level(spdlog::level::warn);

  URE_LOG_DEBUG("hidden", {BoolField("new", false)});
  URE_LOG_WARN("shown", {StringField("quote", "say \"hi\"")});
  spdlog::default_logger()->flush();

  const auto text = out.str();
  assert(text.find("hidden") == std::string::npos);
  assert(text.find("quote=\"say \\\"hi\\\"\"") != std::string::npos);
}

} // namespace

int main() {
  TestFieldHelpersRenderValues();
  TestLinesCarryKeyValueFields();
  TestLevelFiltersBeforeFormatting();

  std::cout << "ure_unit_logging: pass\n";
  return 0;
}
