#include "FakeTunnelSession.hpp"
#include "TestHeaders.hpp"

using namespace kvt;

TEST_CASE("Session opens once and refuses to reopen after close",
          "[TunnelSession]") {
  auto session = make_shared<FakeTunnelSession>(makeTestTunnelEndpoint());
  REQUIRE(session->getState() == TunnelSessionState::CONNECTING);

  session->open();
  REQUIRE(session->isOpen());
  // Opening an open session is a no-op
  session->open();
  REQUIRE(session->getControl()->opens == 1);

  session->close();
  REQUIRE(session->getState() == TunnelSessionState::CLOSED);
  REQUIRE(session->getControl()->teardowns == 1);

  // Idempotent
  session->close();
  REQUIRE(session->getControl()->teardowns == 1);

  try {
    session->open();
    FAIL("open on a closed session must throw");
  } catch (const TunnelError& te) {
    REQUIRE(te.getCode() == TunnelErrorCode::SESSION_CLOSED);
  }
}

TEST_CASE("Failed open leaves the session errored", "[TunnelSession]") {
  auto session = make_shared<FakeTunnelSession>(makeTestTunnelEndpoint());
  session->getControl()->failOpen = true;
  session->getControl()->openFailure = TunnelErrorCode::NETWORK_UNREACHABLE;

  try {
    session->open();
    FAIL("open must throw");
  } catch (const TunnelError& te) {
    REQUIRE(te.getCode() == TunnelErrorCode::NETWORK_UNREACHABLE);
    REQUIRE(te.isSessionFatal());
  }
  REQUIRE(session->getState() == TunnelSessionState::ERRORED);
  REQUIRE_THROWS_AS(session->openChannel(makeTestTargetEndpoint()),
                    TunnelError);
  // Nothing was established, nothing to tear down
  session->close();
  REQUIRE(session->getControl()->teardowns == 0);
}

TEST_CASE("Channel limit is enforced per session", "[TunnelSession]") {
  auto session = make_shared<FakeTunnelSession>(makeTestTunnelEndpoint());
  session->setMaxChannels(2);

  try {
    session->openChannel(makeTestTargetEndpoint());
    FAIL("openChannel before open must throw");
  } catch (const TunnelError& te) {
    REQUIRE(te.getCode() == TunnelErrorCode::SESSION_CLOSED);
  }

  session->open();
  auto first = session->openChannel(makeTestTargetEndpoint());
  auto second = session->openChannel(makeTestTargetEndpoint());
  REQUIRE(session->getOpenChannelCount() == 2);
  REQUIRE(first->getId() != second->getId());

  try {
    session->openChannel(makeTestTargetEndpoint());
    FAIL("third channel must be refused");
  } catch (const TunnelError& te) {
    REQUIRE(te.getCode() == TunnelErrorCode::CHANNEL_LIMIT_EXCEEDED);
    REQUIRE_FALSE(te.isSessionFatal());
  }
  REQUIRE(session->isOpen());

  first->close();
  REQUIRE(session->getOpenChannelCount() == 1);
  auto third = session->openChannel(makeTestTargetEndpoint());
  REQUIRE(session->getOpenChannelCount() == 2);
  session->close();
}

TEST_CASE("Refused forwards do not use up channel slots",
          "[TunnelSession]") {
  auto session = make_shared<FakeTunnelSession>(makeTestTunnelEndpoint());
  session->setMaxChannels(1);
  session->open();
  session->getControl()->queueChannelFailure(TunnelErrorCode::REMOTE_REFUSED);

  REQUIRE_THROWS_AS(session->openChannel(makeTestTargetEndpoint()),
                    TunnelError);
  REQUIRE(session->getOpenChannelCount() == 0);
  REQUIRE(session->isOpen());
  auto channel = session->openChannel(makeTestTargetEndpoint());
  REQUIRE(channel->isUsable());
  session->close();
}

TEST_CASE("Closing a session invalidates its channels", "[TunnelSession]") {
  auto session = make_shared<FakeTunnelSession>(makeTestTunnelEndpoint());
  session->open();
  auto channel = session->openChannel(makeTestTargetEndpoint());
  REQUIRE(channel->isUsable());

  session->close();
  REQUIRE(session->getOpenChannelCount() == 0);
  REQUIRE(channel->getState() == ChannelState::CLOSED);
  REQUIRE_FALSE(channel->isUsable());
  try {
    channel->recv(16);
    FAIL("recv on an invalidated channel must throw");
  } catch (const IoError& ioe) {
    REQUIRE(ioe.getCode() == IoErrorCode::SESSION_BROKEN);
  }
  // Closing the channel afterwards is harmless
  channel->close();
}

TEST_CASE("checkAlive marks a dead session errored", "[TunnelSession]") {
  auto session = make_shared<FakeTunnelSession>(makeTestTunnelEndpoint());
  session->open();
  auto channel = session->openChannel(makeTestTargetEndpoint());
  REQUIRE(session->checkAlive());

  session->kill();
  REQUIRE_FALSE(session->checkAlive());
  REQUIRE(session->getState() == TunnelSessionState::ERRORED);
  REQUIRE_FALSE(channel->isUsable());
  REQUIRE(session->getOpenChannelCount() == 0);

  // markErrored only moves open sessions
  session->markErrored("again");
  REQUIRE(session->getState() == TunnelSessionState::ERRORED);
  session->close();
  REQUIRE(session->getState() == TunnelSessionState::CLOSED);
}

TEST_CASE("Concurrent channel opens respect the limit", "[TunnelSession]") {
  auto session = make_shared<FakeTunnelSession>(makeTestTunnelEndpoint());
  session->setMaxChannels(4);
  session->open();

  atomic<int> opened(0);
  atomic<int> refused(0);
  atomic<int> otherErrors(0);
  vector<shared_ptr<ForwardedChannel>> channels(8);
  vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&, i]() {
      try {
        channels[i] = session->openChannel(makeTestTargetEndpoint());
        opened++;
      } catch (const TunnelError& te) {
        if (te.getCode() == TunnelErrorCode::CHANNEL_LIMIT_EXCEEDED) {
          refused++;
        } else {
          otherErrors++;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  REQUIRE(opened == 4);
  REQUIRE(refused == 4);
  REQUIRE(otherErrors == 0);
  REQUIRE(session->getOpenChannelCount() == 4);
  session->close();
}
