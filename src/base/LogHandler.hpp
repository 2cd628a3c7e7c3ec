#ifndef __KVT_LOG_HANDLER__
#define __KVT_LOG_HANDLER__

#include "Headers.hpp"

namespace kvt {
/**
 * @brief Configures easylogging++ for the pool library, the CLI and the tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging from `argc/argv`.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a fresh file under @p path.
   * @return Full path of the log file that was created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false, bool appendPid = false,
                              const string &maxlogsize = "20971520");

  /** @brief Removes a rolled-over log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

  /** @brief Sets the VLOG level, clamped to easylogging's 0..9 range. */
  static void setVerbosity(int level);

 private:
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace kvt
#endif  // __KVT_LOG_HANDLER__
