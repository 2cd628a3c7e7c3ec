#include "TcpTransport.hpp"

#include <resolv.h>

namespace kvt {
TcpTransport::TcpTransport(const TargetEndpoint& _endpoint,
                           int64_t _connectTimeoutMs)
    : endpoint(_endpoint),
      connectTimeoutMs(_connectTimeoutMs),
      timeoutMs(-1),
      sockFd(-1) {}

TcpTransport::~TcpTransport() { close(); }

void TcpTransport::connect() {
  lock_guard<recursive_mutex> guard(transportMutex);
  if (sockFd != -1) {
    return;
  }
  addrinfo* results = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_V4MAPPED | AI_ADDRCONFIG);
  std::string portname = std::to_string(endpoint.port());

  // (re)initialize the DNS system
  ::res_init();
  int rc = getaddrinfo(endpoint.host().c_str(), portname.c_str(), &hints,
                       &results);
  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    throw IoError(IoErrorCode::PEER_CLOSED,
                  string("Cannot resolve ") + endpoint.host() + ": " +
                      gai_strerror(rc));
  }

  bool timedOut = false;
  for (addrinfo* p = results; p != NULL; p = p->ai_next) {
    int fd = connectToAddress(p);
    if (fd >= 0) {
      sockFd = fd;
      break;
    }
    if (fd == -2) {
      timedOut = true;
    }
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to " << endpoint;
    if (timedOut) {
      throw IoError(IoErrorCode::TIMEOUT, "Timed out connecting to " +
                                              endpoint.host());
    }
    throw IoError(IoErrorCode::PEER_CLOSED,
                  "Could not connect to " + endpoint.host());
  }
  LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
}

// Returns the connected fd, -1 on error, -2 on timeout
int TcpTransport::connectToAddress(addrinfo* p) {
  int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
  if (fd == -1) {
    LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
    return -1;
  }

  // Set nonblocking just for the connect phase
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));

  if (::connect(fd, p->ai_addr, p->ai_addrlen) == -1 && errno != EINPROGRESS) {
    LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
              << strerror(errno);
    ::close(fd);
    return -1;
  }

  if (!waitOnFd(fd, POLLOUT, connectTimeoutMs)) {
    LOG(INFO) << "Timed out connecting to " << endpoint;
    ::close(fd);
    return -2;
  }

  int so_error;
  socklen_t len = sizeof so_error;
  FATAL_FAIL(::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len));
  if (so_error != 0) {
    LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error << " "
              << strerror(so_error);
    ::close(fd);
    return -1;
  }

  // The socket becomes blocking once it's attached to a server.
  FATAL_FAIL(fcntl(fd, F_SETFL, opts & (~O_NONBLOCK)));
  int flag = 1;
  FATAL_FAIL(setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(int)));
  return fd;
}

size_t TcpTransport::send(const void* buf, size_t count) {
  int fd;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    fd = sockFd;
  }
  if (fd == -1) {
    throw IoError(IoErrorCode::PEER_CLOSED, "Transport is not connected");
  }
  while (true) {
    if (!waitOnFd(fd, POLLOUT, timeoutMs)) {
      throw IoError(IoErrorCode::TIMEOUT, "Timed out writing to store");
    }
    ssize_t bytesWritten = ::send(fd, buf, count, MSG_NOSIGNAL);
    if (bytesWritten >= 0) {
      return size_t(bytesWritten);
    }
    auto localErrno = errno;
    if (localErrno == EINTR || localErrno == EAGAIN ||
        localErrno == EWOULDBLOCK) {
      continue;
    }
    VLOG(1) << "Failed a call to send: " << strerror(localErrno);
    throw IoError(IoErrorCode::PEER_CLOSED, strerror(localErrno));
  }
}

string TcpTransport::recv(size_t maxBytes) {
  int fd;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    fd = sockFd;
  }
  if (fd == -1) {
    throw IoError(IoErrorCode::PEER_CLOSED, "Transport is not connected");
  }
  if (maxBytes == 0) {
    return "";
  }
  string s(maxBytes, '\0');
  while (true) {
    if (!waitOnFd(fd, POLLIN, timeoutMs)) {
      throw IoError(IoErrorCode::TIMEOUT, "Timed out reading from store");
    }
    ssize_t bytesRead = ::recv(fd, &s[0], maxBytes, 0);
    if (bytesRead >= 0) {
      s.resize(bytesRead);
      return s;
    }
    auto localErrno = errno;
    if (localErrno == EINTR || localErrno == EAGAIN ||
        localErrno == EWOULDBLOCK) {
      continue;
    }
    VLOG(1) << "Failed a call to recv: " << strerror(localErrno);
    throw IoError(IoErrorCode::PEER_CLOSED, strerror(localErrno));
  }
}

void TcpTransport::close() {
  lock_guard<recursive_mutex> guard(transportMutex);
  if (sockFd == -1) {
    return;
  }
  ::shutdown(sockFd, SHUT_RDWR);
  FATAL_FAIL(::close(sockFd));
  VLOG(1) << "Closed connection to " << endpoint;
  sockFd = -1;
}

void TcpTransport::setTimeout(int64_t _timeoutMs) { timeoutMs = _timeoutMs; }

int64_t TcpTransport::getTimeout() { return timeoutMs; }

bool TcpTransport::isUsable() {
  lock_guard<recursive_mutex> guard(transportMutex);
  return sockFd != -1;
}
}  // namespace kvt
