/**
 * @file test_port_lock.cpp
 * @brief Tests for port_lock.hpp - lock probing and holder lookup.
 */

#include "mg/port_lock.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

std::string MakeTempFile() {
  char tmpl[] = "/tmp/mg_port_XXXXXX";
  int fd = ::mkstemp(tmpl);
  REQUIRE(fd >= 0);
  ::close(fd);
  return tmpl;
}

std::string MakeScript(const char* body) {
  std::string path = MakeTempFile();
  FILE* f = std::fopen(path.c_str(), "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "#!/bin/sh\n%s\n", body);
  std::fclose(f);
  ::chmod(path.c_str(), 0755);
  return path;
}

class FixedLookup : public mg::HolderLookup {
 public:
  explicit FixedLookup(pid_t pid) : pid_(pid) {}
  mg::optional<mg::HolderInfo> Lookup(const char*) override {
    ++calls;
    if (pid_ <= 0) return {};
    mg::HolderInfo h;
    h.command.assign(mg::TruncateToCapacity, "meshtastic");
    h.pid = pid_;
    return mg::optional<mg::HolderInfo>(h);
  }
  int calls = 0;

 private:
  pid_t pid_;
};

}  // namespace

// ============================================================================
// Probe / IsLocked
// ============================================================================

TEST_CASE("port_lock - missing path reports not locked", "[port_lock]") {
  FixedLookup lookup(4321);
  mg::PortLockInspector inspector(&lookup);
  REQUIRE(mg::PortLockInspector::Probe("/dev/does_not_exist_mg") == mg::LockProbe::kMissing);

  mg::PortLockInfo info = inspector.Inspect("/dev/does_not_exist_mg");
  REQUIRE(!info.is_locked);
  REQUIRE(!info.holder.has_value());
  REQUIRE(lookup.calls == 0);
}

TEST_CASE("port_lock - unlocked file", "[port_lock]") {
  std::string path = MakeTempFile();
  mg::PortLockInspector inspector;
  REQUIRE(!inspector.IsLocked(path.c_str()).is_locked);
  ::unlink(path.c_str());
}

TEST_CASE("port_lock - flock held elsewhere is detected and left intact", "[port_lock]") {
  std::string path = MakeTempFile();
  int holder = ::open(path.c_str(), O_RDONLY);
  REQUIRE(holder >= 0);
  REQUIRE(::flock(holder, LOCK_EX | LOCK_NB) == 0);

  FixedLookup lookup(4321);
  mg::PortLockInspector inspector(&lookup);
  mg::PortLockInfo info = inspector.Inspect(path.c_str());
  REQUIRE(info.is_locked);
  REQUIRE(info.holder.has_value());
  REQUIRE(info.holder.value().pid == 4321);
  REQUIRE(info.holder.value().command == "meshtastic");

  // Still ours after the probe.
  REQUIRE(inspector.IsLocked(path.c_str()).is_locked);

  ::close(holder);
  REQUIRE(!inspector.IsLocked(path.c_str()).is_locked);
  ::unlink(path.c_str());
}

TEST_CASE("port_lock - probe leaves no lock behind", "[port_lock]") {
  std::string path = MakeTempFile();
  mg::PortLockInspector inspector;
  (void)inspector.IsLocked(path.c_str());

  int fd = ::open(path.c_str(), O_RDONLY);
  REQUIRE(fd >= 0);
  REQUIRE(::flock(fd, LOCK_EX | LOCK_NB) == 0);
  ::close(fd);
  ::unlink(path.c_str());
}

// ============================================================================
// Self-lock
// ============================================================================

TEST_CASE("port_lock - IsSelfLocked compares holder pid with getpid", "[port_lock]") {
  std::string path = MakeTempFile();

  FixedLookup self(::getpid());
  REQUIRE(mg::PortLockInspector(&self).IsSelfLocked(path.c_str()));

  FixedLookup other(::getpid() + 1);
  REQUIRE(!mg::PortLockInspector(&other).IsSelfLocked(path.c_str()));

  FixedLookup nobody(0);
  REQUIRE(!mg::PortLockInspector(&nobody).IsSelfLocked(path.c_str()));

  ::unlink(path.c_str());
}

// ============================================================================
// LsofHolderLookup
// ============================================================================

TEST_CASE("port_lock - parse lsof field output", "[port_lock][lsof]") {
  auto h = mg::LsofHolderLookup::ParseOutput("p4321\ncminicom\nf3\n");
  REQUIRE(h.has_value());
  REQUIRE(h.value().pid == 4321);
  REQUIRE(h.value().command == "minicom");
}

TEST_CASE("port_lock - parse keeps the first process", "[port_lock][lsof]") {
  auto h = mg::LsofHolderLookup::ParseOutput("p100\ncpython3\np200\ncscreen\n");
  REQUIRE(h.has_value());
  REQUIRE(h.value().pid == 100);
  REQUIRE(h.value().command == "python3");
}

TEST_CASE("port_lock - parse rejects output without pid", "[port_lock][lsof]") {
  REQUIRE(!mg::LsofHolderLookup::ParseOutput("").has_value());
  REQUIRE(!mg::LsofHolderLookup::ParseOutput("cminicom\n").has_value());
  REQUIRE(!mg::LsofHolderLookup::ParseOutput("pabc\n").has_value());
}

#if MG_HAS_HOLDER_LOOKUP

TEST_CASE("port_lock - missing tool degrades to no holder", "[port_lock][lsof]") {
  mg::LsofHolderLookup lookup("mg-no-such-lsof-tool", 2000U);
  REQUIRE(!lookup.Lookup("/dev/ttyACM0").has_value());
}

TEST_CASE("port_lock - tool output is parsed", "[port_lock][lsof]") {
  std::string tool = MakeScript("printf 'p4321\\ncminicom\\n'");
  mg::LsofHolderLookup lookup(tool.c_str(), 2000U);
  auto h = lookup.Lookup("/dev/ttyACM0");
  REQUIRE(h.has_value());
  REQUIRE(h.value().pid == 4321);
  REQUIRE(h.value().command == "minicom");
  ::unlink(tool.c_str());
}

TEST_CASE("port_lock - slow tool is killed at the deadline", "[port_lock][lsof]") {
  std::string tool = MakeScript("exec sleep 10");
  mg::LsofHolderLookup lookup(tool.c_str(), 200U);
  uint64_t t0 = mg::SteadyNowMs();
  REQUIRE(!lookup.Lookup("/dev/ttyACM0").has_value());
  REQUIRE(mg::SteadyNowMs() - t0 < 3000U);
  ::unlink(tool.c_str());
}

#endif
