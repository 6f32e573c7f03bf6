/**
 * @file test_reboot_escalation.cpp
 * @brief Tests for reboot_escalation.hpp - tmpfs reboot signal.
 */

#include "mg/reboot_escalation.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <cstring>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

namespace {

struct TempDir {
  TempDir() {
    char tmpl[] = "/tmp/mg_reboot_XXXXXX";
    REQUIRE(::mkdtemp(tmpl) != nullptr);
    path = tmpl;
  }
  ~TempDir() { ::rmdir(path.c_str()); }
  std::string path;
};

bool Exists(const char* path) {
  struct stat st;
  return ::stat(path, &st) == 0;
}

}  // namespace

TEST_CASE("reboot - fresh signal is not raised", "[reboot]") {
  TempDir dir;
  mg::RebootSignalFile sig(dir.path.c_str());
  REQUIRE(!sig.IsSignalled());
  REQUIRE(sig.ReadInfo().empty());
  REQUIRE(sig.Clear());
}

TEST_CASE("reboot - request holds the lock and records the reason", "[reboot]") {
  TempDir dir;
  mg::RebootSignalFile sig(dir.path.c_str());

  REQUIRE(sig.RequestReboot("I/O health check failed 3 consecutive times."));
  REQUIRE(sig.IsSignalled());
  REQUIRE(Exists(sig.LockPath()));

  mg::RebootSignalFile::InfoText info = sig.ReadInfo();
  REQUIRE(std::strstr(info.c_str(), "Reason: I/O health check failed 3 consecutive times.") !=
          nullptr);
  REQUIRE(std::strstr(info.c_str(), "Timestamp: ") != nullptr);

  REQUIRE(sig.RequestReboot("again"));
  REQUIRE(std::strstr(sig.ReadInfo().c_str(), "again") == nullptr);

  REQUIRE(sig.Clear());
}

TEST_CASE("reboot - a second instance sees the signal", "[reboot]") {
  TempDir dir;
  mg::RebootSignalFile first(dir.path.c_str());
  mg::RebootSignalFile second(dir.path.c_str());

  REQUIRE(first.RequestReboot("write failures"));
  REQUIRE(second.IsSignalled());
  REQUIRE(second.RequestReboot("other reason"));
  REQUIRE(std::strstr(second.ReadInfo().c_str(), "write failures") != nullptr);

  REQUIRE(first.Clear());
  REQUIRE(second.Clear());
}

TEST_CASE("reboot - Clear drops the lock and removes both files", "[reboot]") {
  TempDir dir;
  mg::RebootSignalFile sig(dir.path.c_str());
  REQUIRE(sig.RequestReboot("storage"));

  REQUIRE(sig.Clear());
  REQUIRE(!sig.IsSignalled());
  REQUIRE(!Exists(sig.LockPath()));
  REQUIRE(!Exists(sig.InfoPath()));
  REQUIRE(sig.Clear());

  REQUIRE(sig.RequestReboot("storage again"));
  REQUIRE(sig.IsSignalled());
  REQUIRE(sig.Clear());
}

TEST_CASE("reboot - destructor keeps the files for the watcher", "[reboot]") {
  TempDir dir;
  std::string lock_path;
  {
    mg::RebootSignalFile sig(dir.path.c_str());
    REQUIRE(sig.RequestReboot("storage"));
    lock_path = sig.LockPath();
  }
  REQUIRE(Exists(lock_path.c_str()));

  mg::RebootSignalFile after(dir.path.c_str());
  REQUIRE(!after.IsSignalled());
  REQUIRE(std::strstr(after.ReadInfo().c_str(), "storage") != nullptr);
  REQUIRE(after.Clear());
}

TEST_CASE("reboot - unwritable directory is rejected", "[reboot]") {
  mg::RebootSignalFile sig("/nonexistent_mg_dir");
  REQUIRE(!sig.RequestReboot("storage"));
  REQUIRE(!sig.IsSignalled());
}
