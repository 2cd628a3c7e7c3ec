#include "StoreConnection.hpp"

namespace kvt {
StoreConnection::StoreConnection(shared_ptr<Transport> _transport)
    : transport(_transport), broken(false) {}

void StoreConnection::connect() {
  try {
    transport->connect();
  } catch (const IoError& ioe) {
    rethrowIoError(ioe);
  }
}

void StoreConnection::disconnect() {
  transport->close();
  readBuffer.clear();
}

void StoreConnection::rethrowIoError(const IoError& ioe) {
  if (ioe.getCode() != IoErrorCode::TIMEOUT) {
    VLOG(1) << "Marking store connection broken: " << ioe.what();
    broken = true;
  }
  throw ioe;
}

void StoreConnection::sendRaw(const string& data) {
  try {
    transport->sendAll(data);
  } catch (const IoError& ioe) {
    rethrowIoError(ioe);
  }
}

void StoreConnection::sendInline(const string& command) {
  sendRaw(command + "\r\n");
}

string StoreConnection::readRaw(size_t maxBytes) {
  if (maxBytes == 0) {
    return "";
  }
  if (!readBuffer.empty()) {
    string s = readBuffer.substr(0, maxBytes);
    readBuffer.erase(0, s.length());
    return s;
  }
  string s;
  try {
    s = transport->recv(maxBytes);
  } catch (const IoError& ioe) {
    rethrowIoError(ioe);
  }
  if (s.empty()) {
    // The store hung up, nothing more will come on this connection
    broken = true;
  }
  return s;
}

string StoreConnection::readLine() {
  while (true) {
    auto pos = readBuffer.find("\r\n");
    if (pos != string::npos) {
      string line = readBuffer.substr(0, pos);
      readBuffer.erase(0, pos + 2);
      return line;
    }
    string chunk;
    try {
      chunk = transport->recv(4096);
    } catch (const IoError& ioe) {
      rethrowIoError(ioe);
    }
    if (chunk.empty()) {
      broken = true;
      throw IoError(IoErrorCode::PEER_CLOSED,
                    "Store closed the connection in the middle of a line");
    }
    readBuffer.append(chunk);
  }
}

void StoreConnection::setSocketTimeout(int64_t timeoutMs) {
  transport->setTimeout(timeoutMs);
}

bool StoreConnection::isBroken() { return broken; }

void StoreConnection::markBroken() { broken = true; }

bool StoreConnection::isHealthy() {
  return !broken && transport->isUsable();
}
}  // namespace kvt
