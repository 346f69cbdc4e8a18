#include <qgate/logging.h>

#include <gtest/gtest.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

TEST(LoggingTest, RespectsLogLevelThreshold) {
  std::stringstream stream;
  qgate::StructuredLogger logger(stream, {qgate::LogLevel::kInfo});

  logger.Log(qgate::LogLevel::kDebug, "coverage.attempt", {});
  logger.Log(qgate::LogLevel::kInfo, "refactor.iteration.start", {});

  const auto output = stream.str();
  EXPECT_EQ(std::string::npos, output.find("coverage.attempt"));
  EXPECT_NE(std::string::npos, output.find("level=info"));
  EXPECT_NE(std::string::npos, output.find("refactor.iteration.start"));
}

TEST(LoggingTest, FormatsFieldsAsStructuredPairs) {
  std::stringstream stream;
  qgate::StructuredLogger logger(stream, {qgate::LogLevel::kDebug});

  logger.Log(qgate::LogLevel::kDebug, "pipeline.stage.complete",
             {{"stage", "lint"}, {"duration_ms", "42"}});

  const auto output = stream.str();
  EXPECT_NE(std::string::npos, output.find("fields={\"stage\": \"lint\""));
  EXPECT_NE(std::string::npos, output.find("\"duration_ms\": \"42\"}"));
  EXPECT_NE(std::string::npos,
            output.find("message=\"pipeline.stage.complete\""));
}

TEST(LoggingTest, EnsureLoggerProvidesDefault) {
  auto provided = qgate::EnsureLogger(nullptr);
  EXPECT_NE(nullptr, provided);
  EXPECT_NE(nullptr, std::dynamic_pointer_cast<qgate::NullLogger>(provided));

  auto custom = std::make_shared<qgate::StructuredLogger>(
      std::cout, qgate::LoggingConfig{});
  EXPECT_EQ(custom, qgate::EnsureLogger(custom));
}

TEST(LoggingTest, ParsesLevelNamesCaseInsensitively) {
  EXPECT_EQ(qgate::ParseLogLevel("WARNING"), qgate::LogLevel::kWarn);
  EXPECT_EQ(qgate::ParseLogLevel(" debug "), qgate::LogLevel::kDebug);
  EXPECT_EQ(qgate::LogLevelName(qgate::LogLevel::kError), "error");
  EXPECT_THROW(qgate::ParseLogLevel("chatty"), std::invalid_argument);
}

} // namespace
