#ifndef __KVT_COMMAND_RUNNER__
#define __KVT_COMMAND_RUNNER__

#include "ConnectionPool.hpp"
#include "Headers.hpp"

namespace kvt {
/**
 * @brief Sends inline store commands through a pool and renders the
 * replies, one output line per reply line.
 */
class CommandRunner {
 public:
  explicit CommandRunner(ConnectionPool* _pool);

  /**
   * @brief Runs one command on a leased connection and appends the reply
   * (or an "(error) ..." line) to @p output.
   * @return false when no later command can succeed either.
   */
  bool run(const string& command, vector<string>* output);

 protected:
  void readReply(StoreConnection* conn, int depth, vector<string>* output);
  string readBulk(StoreConnection* conn, size_t length);

  ConnectionPool* pool;
};
}  // namespace kvt

#endif  // __KVT_COMMAND_RUNNER__
