#ifndef __KVT_TRANSPORT__
#define __KVT_TRANSPORT__

#include "Headers.hpp"
#include "TunnelErrors.hpp"

namespace kvt {
/**
 * @brief The socket-like byte stream a store connection talks through.
 *
 * Implementations throw IoError on failure.  A graceful close by the peer is
 * an empty recv(), never an exception, and a broken transport is never an
 * empty recv().
 */
class Transport {
 public:
  virtual ~Transport() {}

  /** @brief Makes the transport ready for I/O.  No-op when already usable. */
  virtual void connect() = 0;
  /** @brief Writes up to @p count bytes and returns how many were written. */
  virtual size_t send(const void* buf, size_t count) = 0;
  /**
   * @brief Reads up to @p maxBytes.  Returns an empty string on graceful
   * peer close.
   */
  virtual string recv(size_t maxBytes) = 0;
  /** @brief Releases the underlying stream.  Idempotent. */
  virtual void close() = 0;
  /**
   * @brief Sets the send/recv timeout in milliseconds; negative blocks
   * forever.
   */
  virtual void setTimeout(int64_t timeoutMs) = 0;
  virtual int64_t getTimeout() = 0;
  /** @brief True when send/recv can currently be attempted. */
  virtual bool isUsable() = 0;

  /**
   * @brief Writes the whole buffer, looping over partial writes.
   * @throws IoError when the transport fails or stops accepting bytes.
   */
  void sendAll(const void* buf, size_t count);
  inline void sendAll(const string& s) { sendAll(s.data(), s.length()); }
};

/**
 * @brief Waits until @p fd is ready for @p events.
 * @param timeoutMs Negative waits forever.
 * @return false on timeout.
 */
bool waitOnFd(int fd, short events, int64_t timeoutMs);
}  // namespace kvt

#endif  // __KVT_TRANSPORT__
