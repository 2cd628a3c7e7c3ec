#include "CommandRunner.hpp"

namespace kvt {
CommandRunner::CommandRunner(ConnectionPool* _pool) : pool(_pool) {}

bool CommandRunner::run(const string& command, vector<string>* output) {
  shared_ptr<PooledConnection> conn;
  try {
    conn = pool->getConnection();
  } catch (const PoolError& pe) {
    output->push_back(string("(error) ") + pe.what());
    // Timeouts and refused channels pass, a shut down pool does not
    return !pool->isShutdown();
  } catch (const TunnelError& te) {
    output->push_back(string("(error) ") + te.what());
    return te.getCode() != TunnelErrorCode::AUTH_FAILED;
  } catch (const IoError& ioe) {
    output->push_back(string("(error) ") + ioe.what());
    return true;
  }

  try {
    conn->sendInline(command);
    readReply(conn.get(), 0, output);
  } catch (const IoError& ioe) {
    output->push_back(string("(error) ") + ioe.what());
  }
  pool->release(conn);
  return true;
}

void CommandRunner::readReply(StoreConnection* conn, int depth,
                              vector<string>* output) {
  string indent(depth * 2, ' ');
  string line = conn->readLine();
  output->push_back(indent + line);
  if (line.empty()) {
    return;
  }
  if (line[0] == '$') {
    int length = atoi(line.c_str() + 1);
    if (length >= 0) {
      output->push_back(indent + readBulk(conn, size_t(length)));
    }
    return;
  }
  if (line[0] == '*') {
    int count = atoi(line.c_str() + 1);
    for (int i = 0; i < count; i++) {
      readReply(conn, depth + 1, output);
    }
  }
}

// The payload may hold CRLF itself: read it by length, then its terminator
string CommandRunner::readBulk(StoreConnection* conn, size_t length) {
  string payload;
  while (payload.length() < length + 2) {
    string chunk = conn->readRaw(length + 2 - payload.length());
    if (chunk.empty()) {
      throw IoError(IoErrorCode::PEER_CLOSED,
                    "Store closed the connection inside a bulk reply");
    }
    payload += chunk;
  }
  payload.resize(length);
  return payload;
}
}  // namespace kvt
