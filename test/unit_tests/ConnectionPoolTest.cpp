#include "DirectConnectionFactory.hpp"
#include "FakeTunnelSession.hpp"
#include "TestHeaders.hpp"
#include "TunneledConnectionPool.hpp"
#include "TunneledTransport.hpp"

using namespace kvt;

namespace {
shared_ptr<TunnelSession> sessionOf(const shared_ptr<PooledConnection>& conn) {
  auto transport =
      dynamic_pointer_cast<TunneledTransport>(conn->getTransport());
  REQUIRE(transport.get() != NULL);
  auto channel = transport->getChannel();
  REQUIRE(channel.get() != NULL);
  return channel->getSession();
}

string echoThrough(const shared_ptr<PooledConnection>& conn,
                   const string& line) {
  conn->sendInline(line);
  return conn->readLine();
}
}  // namespace

TEST_CASE("Pool rejects a zero capacity", "[ConnectionPool]") {
  auto sessionFactory = make_shared<FakeTunnelSessionFactory>();
  REQUIRE_THROWS_AS(
      TunneledConnectionPool(makeTestPoolConfig(false, 0, 100), sessionFactory),
      std::runtime_error);
}

TEST_CASE("Private sessions are opened per lease", "[ConnectionPool]") {
  auto sessionFactory = make_shared<FakeTunnelSessionFactory>();
  auto control = sessionFactory->control;
  control->echo = true;
  TunneledConnectionPool pool(makeTestPoolConfig(false, 3, 1000),
                              sessionFactory);

  for (int a = 0; a < 20; a++) {
    auto conn = pool.getConnection();
    REQUIRE(conn->isHealthy());
    REQUIRE(echoThrough(conn, "PING " + to_string(a)) ==
            "PING " + to_string(a));
    auto stats = pool.getStats();
    REQUIRE(stats.leased == 1);
    REQUIRE(stats.created <= 3);
    pool.release(conn);
  }

  // One slot was reused, but every lease had its own session
  auto stats = pool.getStats();
  REQUIRE(stats.created == 1);
  REQUIRE(stats.free == 1);
  REQUIRE(stats.discarded == 0);
  REQUIRE(sessionFactory->getCreatedCount() == 20);
  REQUIRE(control->opens == 20);
  REQUIRE(control->teardowns == 20);
  REQUIRE(stats.sessionOpenAttempts == 20);
  REQUIRE(pool.getSharedSession().get() == NULL);
}

TEST_CASE("A full pool blocks until a connection is released",
          "[ConnectionPool]") {
  auto sessionFactory = make_shared<FakeTunnelSessionFactory>();
  TunneledConnectionPool pool(makeTestPoolConfig(false, 2, 5000),
                              sessionFactory);

  auto first = pool.getConnection();
  auto second = pool.getConnection();
  REQUIRE(first->getSlotId() != second->getSlotId());

  atomic<bool> done(false);
  atomic<int> thirdSlot(-1);
  shared_ptr<PooledConnection> third;
  std::thread waiter([&]() {
    third = pool.getConnection();
    thirdSlot = third->getSlotId();
    done = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE_FALSE(done);
  REQUIRE(pool.getStats().leased == 2);

  int releasedSlot = first->getSlotId();
  pool.release(first);
  waiter.join();
  REQUIRE(done);
  REQUIRE(thirdSlot == releasedSlot);
  REQUIRE(pool.getStats().created == 2);

  pool.release(second);
  pool.release(third);
  REQUIRE(pool.getStats().free == 2);
}

TEST_CASE("Acquire timeouts", "[ConnectionPool]") {
  auto sessionFactory = make_shared<FakeTunnelSessionFactory>();

  SECTION("A bounded wait times out and leaves capacity alone") {
    TunneledConnectionPool pool(makeTestPoolConfig(false, 1, 100),
                                sessionFactory);
    auto conn = pool.getConnection();
    auto start = std::chrono::steady_clock::now();
    try {
      pool.getConnection();
      FAIL("getConnection must time out");
    } catch (const PoolError& pe) {
      REQUIRE(pe.getCode() == PoolErrorCode::TIMEOUT);
    }
    REQUIRE(std::chrono::steady_clock::now() - start >=
            std::chrono::milliseconds(100));
    auto stats = pool.getStats();
    REQUIRE(stats.created == 1);
    REQUIRE(stats.leased == 1);

    pool.release(conn);
    auto again = pool.getConnection();
    REQUIRE(again->getSlotId() == conn->getSlotId());
    pool.release(again);
  }

  SECTION("A zero timeout fails at once") {
    TunneledConnectionPool pool(makeTestPoolConfig(false, 1, 0),
                                sessionFactory);
    auto conn = pool.getConnection();
    try {
      pool.getConnection();
      FAIL("getConnection must fail");
    } catch (const PoolError& pe) {
      REQUIRE(pe.getCode() == PoolErrorCode::EXHAUSTED);
    }
    pool.release(conn);
  }
}

TEST_CASE("Broken connections are discarded and replaced",
          "[ConnectionPool]") {
  auto sessionFactory = make_shared<FakeTunnelSessionFactory>();
  TunneledConnectionPool pool(makeTestPoolConfig(false, 2, 1000),
                              sessionFactory);

  auto first = pool.getConnection();
  auto second = pool.getConnection();
  auto firstSession = sessionOf(first);
  auto secondSession = sessionOf(second);
  REQUIRE(firstSession != secondSession);

  // Losing one private session leaves the other lease alone
  dynamic_pointer_cast<FakeTunnelSession>(firstSession)->kill();
  try {
    first->readRaw();
    FAIL("readRaw must throw");
  } catch (const IoError& ioe) {
    REQUIRE(ioe.getCode() == IoErrorCode::SESSION_BROKEN);
  }
  REQUIRE(first->isBroken());
  REQUIRE(second->isHealthy());
  REQUIRE(secondSession->isOpen());

  int brokenSlot = first->getSlotId();
  pool.release(first);
  auto stats = pool.getStats();
  REQUIRE(stats.discarded == 1);
  REQUIRE(stats.created == 1);
  REQUIRE(stats.leased == 1);

  // The freed capacity goes to a new slot
  auto replacement = pool.getConnection();
  REQUIRE(replacement->getSlotId() != brokenSlot);
  REQUIRE(replacement->isHealthy());
  REQUIRE(pool.getStats().created == 2);

  pool.release(second);
  pool.release(replacement);
}

TEST_CASE("Releasing connections the pool does not lease",
          "[ConnectionPool]") {
  auto sessionFactory = make_shared<FakeTunnelSessionFactory>();
  TunneledConnectionPool pool(makeTestPoolConfig(false, 2, 1000),
                              sessionFactory);
  TunneledConnectionPool otherPool(makeTestPoolConfig(false, 2, 1000),
                                   sessionFactory);

  REQUIRE_THROWS_AS(pool.release(nullptr), std::runtime_error);

  auto conn = pool.getConnection();
  auto foreign = otherPool.getConnection();
  REQUIRE_THROWS_AS(pool.release(foreign), std::runtime_error);

  pool.release(conn);
  REQUIRE_THROWS_AS(pool.release(conn), std::runtime_error);
  REQUIRE(pool.getStats().free == 1);

  otherPool.release(foreign);
}

TEST_CASE("Session failures surface from getConnection", "[ConnectionPool]") {
  auto sessionFactory = make_shared<FakeTunnelSessionFactory>();
  auto control = sessionFactory->control;
  TunneledConnectionPool pool(makeTestPoolConfig(false, 2, 1000),
                              sessionFactory);

  SECTION("Authentication failures are reported as they are") {
    control->failOpen = true;
    try {
      pool.getConnection();
      FAIL("getConnection must throw");
    } catch (const TunnelError& te) {
      REQUIRE(te.getCode() == TunnelErrorCode::AUTH_FAILED);
    }
  }

  SECTION("A refused forward becomes an unavailable channel") {
    control->queueChannelFailure(TunnelErrorCode::REMOTE_REFUSED);
    try {
      pool.getConnection();
      FAIL("getConnection must throw");
    } catch (const PoolError& pe) {
      REQUIRE(pe.getCode() == PoolErrorCode::CHANNEL_UNAVAILABLE);
    }
    // The private session went away with the failed lease
    REQUIRE(control->teardowns == 1);
  }

  // The slot went back to the pool
  auto stats = pool.getStats();
  REQUIRE(stats.leased == 0);
  REQUIRE(stats.free == 1);

  control->failOpen = false;
  auto conn = pool.getConnection();
  REQUIRE(conn->isHealthy());
  pool.release(conn);
}

TEST_CASE("Shutdown refuses new leases", "[ConnectionPool]") {
  auto sessionFactory = make_shared<FakeTunnelSessionFactory>();
  auto control = sessionFactory->control;
  TunneledConnectionPool pool(makeTestPoolConfig(false, 2, 1000),
                              sessionFactory);

  auto idle = pool.getConnection();
  auto leased = pool.getConnection();
  pool.release(idle);

  pool.shutdown();
  REQUIRE(pool.isShutdown());
  try {
    pool.getConnection();
    FAIL("getConnection must throw");
  } catch (const PoolError& pe) {
    REQUIRE(pe.getCode() == PoolErrorCode::EXHAUSTED);
  }

  // Late releases are accepted and drop the slot
  pool.release(leased);
  auto stats = pool.getStats();
  REQUIRE(stats.created == 0);
  REQUIRE(stats.discarded == 0);
  REQUIRE(control->teardowns == 2);

  // Shutting down twice is harmless
  pool.shutdown();
}

TEST_CASE("Direct pools keep healthy sockets between leases",
          "[ConnectionPool]") {
  LoopbackListener listener;
  ConnectionPool pool(
      make_shared<DirectConnectionFactory>(listener.endpoint(), 1000, 1000),
      2, 1000);

  auto conn = pool.getConnection();
  REQUIRE(conn->isHealthy());
  int serverFd = ::accept(listener.fd, NULL, NULL);
  REQUIRE(serverFd >= 0);
  pool.release(conn);

  auto again = pool.getConnection();
  REQUIRE(again == conn);
  REQUIRE(again->isHealthy());

  // The store hanging up breaks the connection
  ::close(serverFd);
  REQUIRE(again->readRaw() == "");
  REQUIRE(again->isBroken());
  pool.release(again);
  REQUIRE(pool.getStats().discarded == 1);
  REQUIRE(pool.getStats().created == 0);
}
