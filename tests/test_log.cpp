/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "mg/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <unistd.h>

namespace {

/// Redirects stderr into a temp file for the lifetime of the object.
class StderrCapture {
 public:
  StderrCapture() {
    std::fflush(stderr);
    char tmpl[] = "/tmp/mg_log_XXXXXX";
    fd_ = ::mkstemp(tmpl);
    path_ = tmpl;
    saved_ = ::dup(STDERR_FILENO);
    ::dup2(fd_, STDERR_FILENO);
  }

  ~StderrCapture() {
    Restore();
    ::close(fd_);
    ::unlink(path_.c_str());
  }

  std::string Text() {
    Restore();
    std::string out;
    FILE* f = std::fopen(path_.c_str(), "r");
    if (f != nullptr) {
      char buf[1024];
      size_t n;
      while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
      std::fclose(f);
    }
    return out;
  }

 private:
  void Restore() {
    if (saved_ >= 0) {
      std::fflush(stderr);
      ::dup2(saved_, STDERR_FILENO);
      ::close(saved_);
      saved_ = -1;
    }
  }

  int fd_ = -1;
  int saved_ = -1;
  std::string path_;
};

}  // namespace

TEST_CASE("log - default level follows build type", "[log]") {
#ifdef NDEBUG
  REQUIRE(mg::log::GetLevel() == mg::log::Level::kInfo);
#else
  REQUIRE(mg::log::GetLevel() == mg::log::Level::kDebug);
#endif
}

TEST_CASE("log - SetLevel round trip", "[log]") {
  auto prev = mg::log::GetLevel();
  mg::log::SetLevel(mg::log::Level::kError);
  REQUIRE(mg::log::GetLevel() == mg::log::Level::kError);
  mg::log::SetLevel(prev);
}

TEST_CASE("log - Init and Shutdown toggle state", "[log]") {
  REQUIRE(!mg::log::IsInitialized());
  mg::log::Init();
  REQUIRE(mg::log::IsInitialized());
  mg::log::Shutdown();
  REQUIRE(!mg::log::IsInitialized());
}

TEST_CASE("log - line carries level, category and message", "[log]") {
  auto prev = mg::log::GetLevel();
  mg::log::SetLevel(mg::log::Level::kDebug);
  std::string text;
  {
    StderrCapture cap;
    MG_LOG_WARN("Serial", "port %s locked by %s (pid %d)", "/dev/ttyACM0", "minicom", 4321);
    text = cap.Text();
  }
  mg::log::SetLevel(prev);

  REQUIRE(text.find("[WARN]") != std::string::npos);
  REQUIRE(text.find("[Serial]") != std::string::npos);
  REQUIRE(text.find("port /dev/ttyACM0 locked by minicom (pid 4321)") != std::string::npos);
  REQUIRE(text.back() == '\n');
#ifndef NDEBUG
  REQUIRE(text.find("test_log.cpp:") != std::string::npos);
#endif
}

TEST_CASE("log - messages below the runtime level are dropped", "[log]") {
  auto prev = mg::log::GetLevel();
  mg::log::SetLevel(mg::log::Level::kError);
  std::string text;
  {
    StderrCapture cap;
    MG_LOG_INFO("IoHealth", "check passed");
    MG_LOG_WARN("IoHealth", "check slow");
    MG_LOG_ERROR("IoHealth", "check failed");
    text = cap.Text();
  }
  mg::log::SetLevel(prev);

  REQUIRE(text.find("check passed") == std::string::npos);
  REQUIRE(text.find("check slow") == std::string::npos);
  REQUIRE(text.find("check failed") != std::string::npos);
}

TEST_CASE("log - level Off silences everything", "[log]") {
  auto prev = mg::log::GetLevel();
  mg::log::SetLevel(mg::log::Level::kOff);
  std::string text;
  {
    StderrCapture cap;
    MG_LOG_ERROR("WriteErr", "should not appear");
    text = cap.Text();
  }
  mg::log::SetLevel(prev);
  REQUIRE(text.empty());
}

TEST_CASE("log - oversized message is truncated, not overrun", "[log]") {
  auto prev = mg::log::GetLevel();
  mg::log::SetLevel(mg::log::Level::kDebug);
  std::string long_msg(2000, 'x');
  std::string text;
  {
    StderrCapture cap;
    MG_LOG_INFO("Tcp", "%s", long_msg.c_str());
    text = cap.Text();
  }
  mg::log::SetLevel(prev);
  REQUIRE(!text.empty());
  REQUIRE(text.size() < 1000U);
}
