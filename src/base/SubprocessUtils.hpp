#ifndef __KVT_SUBPROCESS_UTILS__
#define __KVT_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace kvt {
/**
 * @brief Starts and reaps helper processes (the ssh binary).  Virtual so
 * tests can replace process creation.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments without a shell and waits for it.
   * @param output Receives everything the command wrote to stdout and stderr.
   * @return The exit status, or -1 when the command could not be started or
   * was killed by a signal.
   */
  virtual int runAndCapture(const string& command, const vector<string>& args,
                            string* output);

  /**
   * @brief Starts a command in the background with the given descriptors as
   * its stdin/stdout/stderr.
   * @return The child pid, or -1 when fork failed.
   */
  virtual pid_t spawn(const string& command, const vector<string>& args,
                      int stdinFd, int stdoutFd, int stderrFd);

  /**
   * @brief Reaps the child if it has exited, without blocking.
   * @return true when the child is gone; @p exitStatus receives its exit code
   * (or -1 when it died from a signal).
   */
  virtual bool pollExit(pid_t pid, int* exitStatus);

  /**
   * @brief Sends SIGTERM, waits up to @p graceMs, then SIGKILL, and reaps.
   * @return The exit status as in pollExit.
   */
  virtual int terminate(pid_t pid, int64_t graceMs);
};
}  // namespace kvt

#endif  // __KVT_SUBPROCESS_UTILS__
