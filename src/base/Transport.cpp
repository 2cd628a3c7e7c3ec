#include "Transport.hpp"

namespace kvt {
void Transport::sendAll(const void* buf, size_t count) {
  size_t pos = 0;
  while (pos < count) {
    size_t bytesWritten = send(((const char*)buf) + pos, count - pos);
    if (bytesWritten == 0) {
      throw IoError(IoErrorCode::PEER_CLOSED, "Stream closed during sendAll");
    }
    pos += bytesWritten;
  }
}

bool waitOnFd(int fd, short events, int64_t timeoutMs) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (true) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    int waitMs = -1;
    if (timeoutMs >= 0) {
      waitMs = int(std::min<int64_t>(millisecondsUntil(deadline), INT32_MAX));
    }
    int rc = ::poll(&pfd, 1, waitMs);
    if (rc == -1) {
      if (errno == EINTR) {
        continue;
      }
      STFATAL << "poll failed on fd " << fd << ": " << strerror(errno);
    }
    if (rc == 0) {
      return false;
    }
    // HUP and ERR count as ready: the following read/write reports them
    return true;
  }
}
}  // namespace kvt
