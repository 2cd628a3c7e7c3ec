#ifndef __KVT_STORE_CONNECTION__
#define __KVT_STORE_CONNECTION__

#include "Headers.hpp"
#include "Transport.hpp"

namespace kvt {
/**
 * @brief Byte-level connection to the key-value store.
 *
 * Knows nothing about the store's protocol beyond CRLF-terminated lines and
 * never learns which transport it runs on.  A connection whose transport
 * reported SESSION_BROKEN or PEER_CLOSED is marked broken and must not be
 * reused.
 */
class StoreConnection {
 public:
  explicit StoreConnection(shared_ptr<Transport> _transport);
  virtual ~StoreConnection() {}

  void connect();
  void disconnect();

  void sendRaw(const string& data);
  /** @brief Sends an inline command terminated by CRLF. */
  void sendInline(const string& command);

  /**
   * @brief Returns buffered bytes or the next chunk from the transport.
   * Empty when the store closed the connection, or at once when
   * @p maxBytes is 0.
   */
  string readRaw(size_t maxBytes = 4096);

  /**
   * @brief Reads one line without its CRLF terminator.
   * @throws IoError PEER_CLOSED when the store closes mid-line.
   */
  string readLine();

  void setSocketTimeout(int64_t timeoutMs);

  bool isBroken();
  void markBroken();
  /** @brief Not broken and the transport can still do I/O. */
  bool isHealthy();

  shared_ptr<Transport> getTransport() { return transport; }

 protected:
  [[noreturn]] void rethrowIoError(const IoError& ioe);

  shared_ptr<Transport> transport;
  string readBuffer;
  atomic<bool> broken;
};

/**
 * @brief A store connection that belongs to a pool slot.
 */
class PooledConnection : public StoreConnection {
 public:
  PooledConnection(int _slotId, shared_ptr<Transport> _transport)
      : StoreConnection(_transport), slotId(_slotId) {}

  int getSlotId() const { return slotId; }

 protected:
  int slotId;
};
}  // namespace kvt

#endif  // __KVT_STORE_CONNECTION__
