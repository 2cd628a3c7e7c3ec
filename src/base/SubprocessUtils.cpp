#include "SubprocessUtils.hpp"

namespace kvt {
namespace {
int decodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

// argv has to be built before fork: only async-signal-safe calls are allowed
// in the child of a multithreaded process.
vector<char*> buildArgv(const string& command, const vector<string>& args,
                        vector<string>* storage) {
  storage->clear();
  storage->push_back(command);
  storage->insert(storage->end(), args.begin(), args.end());
  vector<char*> argv;
  for (auto& s : *storage) {
    argv.push_back(&s[0]);
  }
  argv.push_back(NULL);
  return argv;
}

void execChild(const vector<char*>& argv, int stdinFd, int stdoutFd,
               int stderrFd, long maxFd) {
  if (dup2(stdinFd, STDIN_FILENO) == -1 ||
      dup2(stdoutFd, STDOUT_FILENO) == -1 ||
      dup2(stderrFd, STDERR_FILENO) == -1) {
    _exit(127);
  }
  for (long fd = 3; fd < maxFd; fd++) {
    ::close(fd);
  }
  ::signal(SIGPIPE, SIG_DFL);
  execvp(argv[0], argv.data());
  _exit(127);
}

long maxFdToClose() {
  long maxFd = sysconf(_SC_OPEN_MAX);
  if (maxFd < 0 || maxFd > 4096) {
    maxFd = 4096;
  }
  return maxFd;
}
}  // namespace

int SubprocessUtils::runAndCapture(const string& command,
                                   const vector<string>& args,
                                   string* output) {
  int link[2];
  FATAL_FAIL(::pipe(link));
  int devNull = ::open("/dev/null", O_RDONLY);
  FATAL_FAIL(devNull);

  vector<string> storage;
  auto argv = buildArgv(command, args, &storage);
  long maxFd = maxFdToClose();

  pid_t pid = fork();
  if (pid == 0) {
    execChild(argv, devNull, link[1], link[1], maxFd);
  }
  ::close(link[1]);
  ::close(devNull);
  if (pid < 0) {
    LOG(ERROR) << "Failed to fork " << command << ": " << strerror(errno);
    ::close(link[0]);
    return -1;
  }

  char buf[4096];
  while (true) {
    ssize_t nbytes = ::read(link[0], buf, sizeof(buf));
    if (nbytes < 0 && errno == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    if (output) {
      output->append(buf, nbytes);
    }
  }
  ::close(link[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      LOG(ERROR) << "waitpid failed for " << command << ": "
                 << strerror(errno);
      return -1;
    }
  }
  VLOG(2) << "Command " << command << " exited with "
          << decodeWaitStatus(status);
  return decodeWaitStatus(status);
}

pid_t SubprocessUtils::spawn(const string& command, const vector<string>& args,
                             int stdinFd, int stdoutFd, int stderrFd) {
  vector<string> storage;
  auto argv = buildArgv(command, args, &storage);
  long maxFd = maxFdToClose();

  pid_t pid = fork();
  if (pid == 0) {
    execChild(argv, stdinFd, stdoutFd, stderrFd, maxFd);
  }
  if (pid < 0) {
    LOG(ERROR) << "Failed to fork " << command << ": " << strerror(errno);
    return -1;
  }
  VLOG(1) << "Started " << command << " as pid " << pid;
  return pid;
}

bool SubprocessUtils::pollExit(pid_t pid, int* exitStatus) {
  int status = 0;
  pid_t rc = ::waitpid(pid, &status, WNOHANG);
  if (rc == 0) {
    return false;
  }
  if (rc == -1) {
    // Already reaped (or never ours): treat as gone
    if (errno != ECHILD) {
      LOG(WARNING) << "waitpid(" << pid << ") failed: " << strerror(errno);
    }
    if (exitStatus) {
      *exitStatus = -1;
    }
    return true;
  }
  if (exitStatus) {
    *exitStatus = decodeWaitStatus(status);
  }
  return true;
}

int SubprocessUtils::terminate(pid_t pid, int64_t graceMs) {
  int exitStatus = -1;
  if (pollExit(pid, &exitStatus)) {
    return exitStatus;
  }
  ::kill(pid, SIGTERM);
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(graceMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pollExit(pid, &exitStatus)) {
      return exitStatus;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(SUBPROCESS_POLL_INTERVAL_MS));
  }
  LOG(WARNING) << "pid " << pid << " ignored SIGTERM, killing";
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return decodeWaitStatus(status);
}
}  // namespace kvt
