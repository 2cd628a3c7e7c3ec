#include "ConnectionPool.hpp"

namespace kvt {
ConnectionPool::ConnectionPool(shared_ptr<ConnectionFactory> _factory,
                               int _maxConnections, int64_t _acquireTimeoutMs)
    : factory(_factory),
      maxConnections(_maxConnections),
      acquireTimeoutMs(_acquireTimeoutMs),
      nextSlotId(0),
      discarded(0),
      shuttingDown(false) {
  if (maxConnections <= 0) {
    throw std::runtime_error("A pool needs at least one connection");
  }
}

ConnectionPool::~ConnectionPool() { shutdown(); }

int ConnectionPool::findFreeSlot() {
  for (auto& it : slots) {
    if (it.second.state == SlotState::FREE) {
      return it.first;
    }
  }
  return -1;
}

shared_ptr<PooledConnection> ConnectionPool::getConnection() {
  unique_lock<mutex> lock(poolMutex);
  AcquireContext ctx;
  ctx.lock = &lock;
  ctx.cv = &poolCv;
  ctx.hasDeadline = acquireTimeoutMs > 0;
  ctx.deadline =
      std::chrono::steady_clock::now() +
      std::chrono::milliseconds(std::max<int64_t>(0, acquireTimeoutMs));

  int slotId;
  bool timedOut = false;
  while (true) {
    if (shuttingDown) {
      throw PoolError(PoolErrorCode::EXHAUSTED, "Pool is shut down");
    }
    slotId = findFreeSlot();
    if (slotId == -1 && int(slots.size()) < maxConnections) {
      slotId = nextSlotId++;
      Slot slot;
      slot.connection = factory->makeConnection(slotId);
      slot.state = SlotState::FREE;
      slots[slotId] = slot;
      VLOG(1) << "Created pool slot " << slotId;
    }
    if (slotId != -1) {
      break;
    }
    if (acquireTimeoutMs == 0) {
      throw PoolError(PoolErrorCode::EXHAUSTED,
                      "Too many connections (" + to_string(maxConnections) +
                          " leased)");
    }
    if (timedOut) {
      throw PoolError(PoolErrorCode::TIMEOUT,
                      "No connection freed up within " +
                          to_string(acquireTimeoutMs) + " ms");
    }
    if (acquireTimeoutMs < 0) {
      poolCv.wait(lock);
    } else if (poolCv.wait_until(lock, ctx.deadline) ==
               std::cv_status::timeout) {
      timedOut = true;
    }
  }

  auto& slot = slots[slotId];
  slot.state = SlotState::LEASED;
  auto conn = slot.connection;
  try {
    factory->activate(conn, ctx);
  } catch (...) {
    // The lock is held again here: give the slot back
    auto it = slots.find(slotId);
    if (it != slots.end()) {
      it->second.state = SlotState::FREE;
    }
    poolCv.notify_all();
    throw;
  }
  VLOG(1) << "Leased pool slot " << slotId;
  return conn;
}

void ConnectionPool::release(const shared_ptr<PooledConnection>& conn) {
  if (conn.get() == NULL) {
    throw std::runtime_error("Tried to release a null connection");
  }
  int slotId = conn->getSlotId();
  {
    lock_guard<mutex> guard(poolMutex);
    auto it = slots.find(slotId);
    if (it == slots.end() || it->second.connection != conn ||
        it->second.state != SlotState::LEASED) {
      throw std::runtime_error("Connection " + to_string(slotId) +
                               " is not leased from this pool");
    }
    it->second.state = SlotState::RELEASING;
  }

  bool healthy = conn->isHealthy();
  factory->deactivate(conn, healthy);

  bool disconnectAfter = false;
  {
    lock_guard<mutex> guard(poolMutex);
    auto it = slots.find(slotId);
    if (healthy && !shuttingDown) {
      it->second.state = SlotState::FREE;
      VLOG(1) << "Released pool slot " << slotId;
    } else {
      slots.erase(it);
      if (!healthy) {
        discarded++;
        LOG(INFO) << "Discarded broken pool slot " << slotId;
      }
      disconnectAfter = true;
    }
    poolCv.notify_all();
  }
  if (disconnectAfter) {
    conn->disconnect();
  }
}

void ConnectionPool::shutdown() {
  vector<shared_ptr<PooledConnection>> idle;
  {
    unique_lock<mutex> lock(poolMutex);
    if (shuttingDown) {
      return;
    }
    shuttingDown = true;
    for (auto it = slots.begin(); it != slots.end();) {
      if (it->second.state == SlotState::FREE) {
        idle.push_back(it->second.connection);
        it = slots.erase(it);
      } else {
        ++it;
      }
    }
    factory->shutdown(&lock);
    poolCv.notify_all();
  }
  for (auto& conn : idle) {
    conn->disconnect();
  }
  LOG(INFO) << "Pool shut down, closed " << idle.size()
            << " idle connections";
}

PoolStats ConnectionPool::getStats() {
  lock_guard<mutex> guard(poolMutex);
  PoolStats stats;
  stats.maxConnections = maxConnections;
  stats.created = int(slots.size());
  for (auto& it : slots) {
    if (it.second.state == SlotState::FREE) {
      stats.free++;
    } else {
      stats.leased++;
    }
  }
  stats.discarded = discarded;
  factory->fillStats(&stats);
  return stats;
}

bool ConnectionPool::isShutdown() {
  lock_guard<mutex> guard(poolMutex);
  return shuttingDown;
}
}  // namespace kvt
