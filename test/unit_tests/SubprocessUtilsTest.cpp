#include "SubprocessUtils.hpp"
#include "TestHeaders.hpp"

using namespace kvt;

TEST_CASE("runAndCapture returns output and exit status",
          "[SubprocessUtils]") {
  SubprocessUtils utils;
  string output;
  REQUIRE(utils.runAndCapture("printf", {"test123"}, &output) == 0);
  REQUIRE(output == "test123");

  output.clear();
  REQUIRE(utils.runAndCapture("sh", {"-c", "echo oops 1>&2; exit 3"},
                              &output) == 3);
  REQUIRE(output.find("oops") != string::npos);
}

TEST_CASE("runAndCapture reports a missing binary", "[SubprocessUtils]") {
  SubprocessUtils utils;
  string output;
  REQUIRE(utils.runAndCapture("kvt-no-such-binary-on-path", {}, &output) ==
          127);
}

TEST_CASE("spawn wires the given descriptors", "[SubprocessUtils]") {
  SubprocessUtils utils;
  int fds[2];
  FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));

  pid_t pid = utils.spawn("cat", {}, fds[1], fds[1], STDERR_FILENO);
  REQUIRE(pid > 0);
  ::close(fds[1]);

  REQUIRE(::write(fds[0], "ping", 4) == 4);
  char buf[4];
  size_t got = 0;
  while (got < 4) {
    ssize_t n = ::read(fds[0], buf + got, 4 - got);
    REQUIRE(n > 0);
    got += n;
  }
  REQUIRE(string(buf, 4) == "ping");

  int exitStatus;
  REQUIRE_FALSE(utils.pollExit(pid, &exitStatus));
  ::shutdown(fds[0], SHUT_WR);
  REQUIRE(waitFor([&]() { return utils.pollExit(pid, &exitStatus); }));
  REQUIRE(exitStatus == 0);
  ::close(fds[0]);
}

TEST_CASE("terminate stops a running child", "[SubprocessUtils]") {
  SubprocessUtils utils;
  int devNull = ::open("/dev/null", O_RDWR);
  FATAL_FAIL(devNull);
  pid_t pid = utils.spawn("sleep", {"30"}, devNull, devNull, devNull);
  ::close(devNull);
  REQUIRE(pid > 0);

  // sleep dies from SIGTERM
  REQUIRE(utils.terminate(pid, 1000) == -1);
  int exitStatus;
  REQUIRE(utils.pollExit(pid, &exitStatus));
}
