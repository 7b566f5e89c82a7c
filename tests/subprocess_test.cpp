#include "video/Subprocess.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "core/Errors.hpp"

namespace {

using reclaim::MediaProcessingError;
using reclaim::Subprocess;
using namespace std::chrono_literals;

void TestCapturesBothStreams() {
  const auto result =
      Subprocess::run({"/bin/sh", "-c", "echo hello; echo oops 1>&2"}, 5000ms);
  assert(result.exitCode == 0);
  assert(result.stdoutText == "hello\n");
  assert(result.stderrText == "oops\n");
}

void TestLargeOutputIsNotTruncated() {
  const auto result = Subprocess::run(
      {"/bin/sh", "-c", "i=0; while [ $i -lt 5000 ]; do echo 0123456789; i=$((i+1)); done"},
      10000ms);
  assert(result.stdoutText.size() == 5000 * 11);
}

void TestNonZeroExitThrows() {
  bool threw = false;
  try {
    Subprocess::run({"/bin/sh", "-c", "echo broken 1>&2; exit 3"}, 5000ms);
  } catch (const MediaProcessingError &e) {
    threw = true;
    assert(e.stage() == "/bin/sh");
    assert(std::string(e.what()).find("3") != std::string::npos);
  }
  assert(threw);
}

void TestMissingProgramThrows() {
  bool threw = false;
  try {
    Subprocess::run({"reclaim-no-such-tool-xyz"}, 5000ms);
  } catch (const MediaProcessingError &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Subprocess::run({}, 5000ms);
  } catch (const MediaProcessingError &) {
    threw = true;
  }
  assert(threw);
}

void TestTimeoutKillsChild() {
  const auto start = std::chrono::steady_clock::now();
  bool threw = false;
  try {
    Subprocess::run({"sleep", "5"}, 200ms);
  } catch (const MediaProcessingError &e) {
    threw = true;
    assert(std::string(e.what()).find("timed out") != std::string::npos);
  }
  assert(threw);
  assert(std::chrono::steady_clock::now() - start < 3s);
}

void TestAvailability() {
  assert(Subprocess::isAvailable("sh"));
  assert(Subprocess::isAvailable("/bin/sh"));
  assert(!Subprocess::isAvailable("reclaim-no-such-tool-xyz"));
  assert(!Subprocess::isAvailable("/nonexistent/tool"));
}

void TestJoinArgsQuotes() {
  assert(Subprocess::joinArgs({"ffmpeg", "-i", "in.mp4"}) == "ffmpeg -i in.mp4");
  assert(Subprocess::joinArgs({"ffmpeg", "-vf", "a b", ""}) ==
         "ffmpeg -vf \"a b\" \"\"");
}

} // namespace

int main() {
  TestCapturesBothStreams();
  TestLargeOutputIsNotTruncated();
  TestNonZeroExitThrows();
  TestMissingProgramThrows();
  TestTimeoutKillsChild();
  TestAvailability();
  TestJoinArgsQuotes();

  std::cout << "reclaim_unit_subprocess: pass\n";
  return 0;
}
