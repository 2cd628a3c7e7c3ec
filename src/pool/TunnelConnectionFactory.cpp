#include "TunnelConnectionFactory.hpp"

#include "TunneledTransport.hpp"

namespace kvt {
TunnelConnectionFactory::TunnelConnectionFactory(
    const PoolConfig& _config, shared_ptr<TunnelSessionFactory> _sessionFactory)
    : config(_config),
      sessionFactory(_sessionFactory),
      sharedOpenInFlight(false),
      sharedGeneration(0),
      shuttingDown(false),
      sessionOpenAttempts(0),
      sessionReopens(0) {}

void TunnelConnectionFactory::adoptSession(shared_ptr<TunnelSession> session) {
  if (sharedSession.get()) {
    STFATAL << "Tried to adopt a session after the shared session was set";
  }
  sharedSession = session;
  LOG(INFO) << "Adopted tunnel session " << session->getId() << " to "
            << session->getEndpoint();
}

shared_ptr<PooledConnection> TunnelConnectionFactory::makeConnection(
    int slotId) {
  return make_shared<PooledConnection>(slotId,
                                       make_shared<TunneledTransport>());
}

void TunnelConnectionFactory::activate(const shared_ptr<PooledConnection>& conn,
                                       AcquireContext& ctx) {
  if (config.shared()) {
    activateShared(conn, ctx);
  } else {
    activateNonShared(conn, ctx);
  }
}

void TunnelConnectionFactory::bindChannel(
    const shared_ptr<PooledConnection>& conn,
    shared_ptr<ForwardedChannel> channel,
    shared_ptr<TunnelSession> ownedSession) {
  auto transport =
      dynamic_pointer_cast<TunneledTransport>(conn->getTransport());
  if (transport.get() == NULL) {
    STFATAL << "Connection " << conn->getSlotId()
            << " was not built by this factory";
  }
  transport->attach(channel, ownedSession);
  conn->setSocketTimeout(config.socket_timeout_ms());
  try {
    conn->connect();
  } catch (const IoError& ioe) {
    // The slot goes back to the pool and must not keep this channel
    transport->close();
    throw;
  }
}

void TunnelConnectionFactory::activateNonShared(
    const shared_ptr<PooledConnection>& conn, AcquireContext& ctx) {
  sessionOpenAttempts++;
  UnlockGuard unlock(ctx.lock);
  auto session = sessionFactory->create(config.tunnel());
  shared_ptr<ForwardedChannel> channel;
  try {
    session->open();
    channel = session->openChannel(config.target());
  } catch (const TunnelError& te) {
    session->close();
    if (te.isSessionFatal()) {
      throw;
    }
    throw PoolError(PoolErrorCode::CHANNEL_UNAVAILABLE, te.what());
  }
  bindChannel(conn, channel, session);
}

void TunnelConnectionFactory::activateShared(
    const shared_ptr<PooledConnection>& conn, AcquireContext& ctx) {
  bool reopened = false;
  while (true) {
    auto session = acquireSharedSession(ctx);
    // Invalidating channels can wait on processes: keep the pool unlocked
    UnlockGuard unlock(ctx.lock);
    shared_ptr<ForwardedChannel> channel;
    try {
      channel = session->openChannel(config.target());
    } catch (const TunnelError& te) {
      if (!te.isSessionFatal()) {
        // The session itself is fine, leave it alone
        throw PoolError(PoolErrorCode::CHANNEL_UNAVAILABLE, te.what());
      }
      session->markErrored(te.what());
      if (reopened) {
        throw;
      }
      LOG(INFO) << "Shared session " << session->getId()
                << " could not open a channel, reopening: " << te.what();
      reopened = true;
      continue;
    }
    bindChannel(conn, channel, nullptr);
    return;
  }
}

shared_ptr<TunnelSession> TunnelConnectionFactory::acquireSharedSession(
    AcquireContext& ctx) {
  bool waited = false;
  std::chrono::steady_clock::time_point reopenDeadline;
  while (true) {
    if (shuttingDown) {
      throw PoolError(PoolErrorCode::EXHAUSTED, "Pool is shut down");
    }
    if (!sharedOpenInFlight) {
      auto session = sharedSession;
      if (session.get() && session->isOpen()) {
        bool alive;
        {
          // A dead transport invalidates every channel on the session
          UnlockGuard unlock(ctx.lock);
          alive = session->checkAlive();
        }
        if (sharedSession != session || sharedOpenInFlight || shuttingDown) {
          // Replaced while we were probing it
          continue;
        }
        if (alive) {
          return session;
        }
      }
      return openSharedSession(ctx);
    }

    // Someone else is opening the session: wait for the outcome
    if (!waited) {
      waited = true;
      reopenDeadline = std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(config.reopen_wait_ms());
    }
    bool bounded = config.reopen_wait_ms() >= 0;
    bool reopenBoundFirst =
        bounded && (!ctx.hasDeadline || reopenDeadline <= ctx.deadline);
    uint64_t generation = sharedGeneration;
    while (sharedGeneration == generation) {
      if (!bounded && !ctx.hasDeadline) {
        ctx.cv->wait(*ctx.lock);
        continue;
      }
      auto waitDeadline = reopenBoundFirst ? reopenDeadline : ctx.deadline;
      if (ctx.cv->wait_until(*ctx.lock, waitDeadline) ==
              std::cv_status::timeout &&
          sharedGeneration == generation) {
        if (reopenBoundFirst) {
          throw TunnelError(TunnelErrorCode::SESSION_UNAVAILABLE,
                            "Shared session still opening after " +
                                to_string(config.reopen_wait_ms()) + " ms");
        }
        throw PoolError(PoolErrorCode::TIMEOUT,
                        "Timed out waiting for the shared tunnel session");
      }
    }
    if (lastOpenFailure) {
      std::rethrow_exception(lastOpenFailure);
    }
  }
}

shared_ptr<TunnelSession> TunnelConnectionFactory::openSharedSession(
    AcquireContext& ctx) {
  shared_ptr<TunnelSession> oldSession = sharedSession;
  shared_ptr<TunnelSession> session;
  if (oldSession.get() &&
      oldSession->getState() == TunnelSessionState::CONNECTING) {
    // An adopted session that was never opened
    session = oldSession;
    oldSession.reset();
  } else if (oldSession.get()) {
    sessionReopens++;
  }
  sharedOpenInFlight = true;
  sessionOpenAttempts++;

  std::exception_ptr failure;
  {
    UnlockGuard unlock(ctx.lock);
    if (oldSession.get()) {
      LOG(INFO) << "Retiring shared session " << oldSession->getId() << " ("
                << toString(oldSession->getState()) << ")";
      oldSession->close();
    }
    try {
      if (session.get() == NULL) {
        session = sessionFactory->create(config.tunnel());
      }
      session->open();
    } catch (...) {
      failure = std::current_exception();
      if (session.get()) {
        session->close();
      }
    }
  }

  sharedOpenInFlight = false;
  sharedGeneration++;
  lastOpenFailure = failure;
  ctx.cv->notify_all();
  if (failure) {
    sharedSession.reset();
    std::rethrow_exception(failure);
  }
  if (shuttingDown) {
    sharedSession.reset();
    {
      UnlockGuard unlock(ctx.lock);
      session->close();
    }
    throw PoolError(PoolErrorCode::EXHAUSTED, "Pool is shut down");
  }
  sharedSession = session;
  LOG(INFO) << "Shared tunnel session " << session->getId() << " is open";
  return session;
}

void TunnelConnectionFactory::deactivate(
    const shared_ptr<PooledConnection>& conn, bool healthy) {
  // Channels are never reused: each lease opens a fresh one
  conn->disconnect();
}

void TunnelConnectionFactory::shutdown(unique_lock<mutex>* lock) {
  shuttingDown = true;
  shared_ptr<TunnelSession> session;
  if (!sharedOpenInFlight) {
    session.swap(sharedSession);
  }
  if (session.get()) {
    UnlockGuard unlock(lock);
    session->close();
  }
}

void TunnelConnectionFactory::fillStats(PoolStats* stats) {
  stats->sessionOpenAttempts = sessionOpenAttempts;
  stats->sessionReopens = sessionReopens;
}
}  // namespace kvt
