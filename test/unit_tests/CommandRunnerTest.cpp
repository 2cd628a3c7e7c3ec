#include "CommandRunner.hpp"
#include "DirectConnectionFactory.hpp"
#include "TestHeaders.hpp"

using namespace kvt;

namespace {
// Answers the first command it receives with a fixed reply
class CannedStore {
 public:
  explicit CannedStore(const string& reply) {
    server = std::thread([this, reply]() {
      int fd = ::accept(listener.fd, NULL, NULL);
      if (fd < 0) {
        return;
      }
      char buf[256];
      string got;
      while (got.find("\r\n") == string::npos) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) {
          ::close(fd);
          return;
        }
        got.append(buf, n);
      }
      {
        lock_guard<mutex> guard(receivedMutex);
        received = got;
      }
      ssize_t written = ::write(fd, reply.data(), reply.length());
      if (written == ssize_t(reply.length())) {
        // Hold the connection until the pool lets go of it
        while (::read(fd, buf, sizeof(buf)) > 0) {
        }
      }
      ::close(fd);
    });
  }

  ~CannedStore() { server.join(); }

  string getReceived() {
    lock_guard<mutex> guard(receivedMutex);
    return received;
  }

  LoopbackListener listener;

 private:
  mutex receivedMutex;
  string received;
  std::thread server;
};

vector<string> runOne(CannedStore* store, const string& command) {
  vector<string> output;
  ConnectionPool pool(
      make_shared<DirectConnectionFactory>(store->listener.endpoint(), 2000,
                                           1000),
      1, 1000);
  CommandRunner runner(&pool);
  REQUIRE(runner.run(command, &output));
  return output;
}
}  // namespace

TEST_CASE("Replies are rendered line by line", "[CommandRunner]") {
  SECTION("Bulk payload") {
    CannedStore store("$10\r\nhello\r\nabc\r\n");
    auto output = runOne(&store, "GET greeting");
    REQUIRE(output == vector<string>({"$10", "hello\r\nabc"}));
  }

  SECTION("Nil bulk") {
    CannedStore store("$-1\r\n");
    auto output = runOne(&store, "GET missing");
    REQUIRE(output == vector<string>({"$-1"}));
  }

  SECTION("Nested array") {
    CannedStore store("*2\r\n$3\r\nfoo\r\n:7\r\n");
    auto output = runOne(&store, "LRANGE list 0 -1");
    REQUIRE(output == vector<string>({"*2", "  $3", "  foo", "  :7"}));
    REQUIRE(store.getReceived() == "LRANGE list 0 -1\r\n");
  }
}

TEST_CASE("Pool errors do not end the session", "[CommandRunner]") {
  LoopbackListener listener;
  ConnectionPool pool(
      make_shared<DirectConnectionFactory>(listener.endpoint(), 1000, 1000),
      1, 0);
  CommandRunner runner(&pool);

  auto held = pool.getConnection();
  vector<string> output;
  REQUIRE(runner.run("PING", &output));
  REQUIRE(output.size() == 1);
  REQUIRE(output[0].find("(error) ") == 0);
  pool.release(held);

  pool.shutdown();
  output.clear();
  REQUIRE_FALSE(runner.run("PING", &output));
  REQUIRE(output.size() == 1);
}
