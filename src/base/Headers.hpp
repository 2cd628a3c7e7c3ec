#ifndef __KVT_HEADERS__
#define __KVT_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <pwd.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>

#include <errno.h>
#include <google/protobuf/message_lite.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "KvTunnel.pb.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef KVT_VERSION
#define KVT_VERSION "unknown"
#endif

// Default ssh port of the intermediary host
const int DEFAULT_TUNNEL_PORT = 22;

// Interval used when polling a child ssh process for a state change
const int SUBPROCESS_POLL_INTERVAL_MS = 10;

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

namespace kvt {
inline std::ostream &operator<<(std::ostream &os, const TunnelEndpoint &te) {
  if (te.has_user() && !te.user().empty()) {
    os << te.user() << "@";
  }
  if (te.host().find(':') != string::npos) {
    os << "[" << te.host() << "]";
  } else {
    os << te.host();
  }
  os << ":" << te.port();
  return os;
}

inline std::ostream &operator<<(std::ostream &os, const TargetEndpoint &te) {
  if (te.host().find(':') != string::npos) {
    os << "[" << te.host() << "]";
  } else {
    os << te.host();
  }
  os << ":" << te.port();
  return os;
}

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string genRandomAlphaNum(int len) {
  static const char alphanum[] =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";
  string s(len, '\0');

  for (int i = 0; i < len; ++i) {
    s[i] = alphanum[randombytes_uniform(sizeof(alphanum) - 1)];
  }

  return s;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline string GetOsUserName() {
  auto pw = getpwuid(getuid());
  if (pw == NULL || pw->pw_name == NULL) {
    return to_string(getuid());
  }
  return string(pw->pw_name);
}

inline string GetHomeDirectory() {
  const char *home = getenv("HOME");
  if (home != NULL) {
    return string(home);
  }
  auto pw = getpwuid(getuid());
  if (pw == NULL || pw->pw_dir == NULL) {
    return "";
  }
  return string(pw->pw_dir);
}

inline int64_t millisecondsUntil(
    const std::chrono::steady_clock::time_point &deadline) {
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  return std::max<int64_t>(0, remaining.count());
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace kvt

#endif  // __KVT_HEADERS__
