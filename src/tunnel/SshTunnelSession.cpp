#include "SshTunnelSession.hpp"

#include "EndpointUtils.hpp"

namespace kvt {
namespace {
bool contains(const string& haystack, const char* needle) {
  return haystack.find(needle) != string::npos;
}

string readFileContents(const string& path) {
  std::ifstream in(path);
  if (!in.good()) {
    return "";
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// Reads whatever is buffered in a non-blocking fd
string drainFd(int fd) {
  string output;
  char buf[1024];
  while (true) {
    ssize_t nbytes = ::read(fd, buf, sizeof(buf));
    if (nbytes > 0) {
      output.append(buf, nbytes);
      continue;
    }
    if (nbytes < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  return output;
}

string lastLine(string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
  auto pos = s.rfind('\n');
  return pos == string::npos ? s : s.substr(pos + 1);
}
}  // namespace

TunnelError classifySessionFailure(const string& sshOutput, int exitStatus) {
  string detail = lastLine(sshOutput);
  if (detail.empty()) {
    detail = "ssh exited with status " + to_string(exitStatus);
  }
  if (contains(sshOutput, "Permission denied") ||
      contains(sshOutput, "Too many authentication failures") ||
      contains(sshOutput, "Host key verification failed") ||
      contains(sshOutput, "no matching host key")) {
    return TunnelError(TunnelErrorCode::AUTH_FAILED, detail);
  }
  if (contains(sshOutput, "timed out")) {
    return TunnelError(TunnelErrorCode::TIMEOUT, detail);
  }
  // Unresolvable, unroutable, refused and everything else we can't place
  return TunnelError(TunnelErrorCode::NETWORK_UNREACHABLE, detail);
}

TunnelError classifyChannelFailure(const string& sshOutput, bool masterAlive) {
  string detail = lastLine(sshOutput);
  if (detail.empty()) {
    detail = "ssh forward client exited";
  }
  if (!masterAlive || contains(sshOutput, "Control socket") ||
      contains(sshOutput, "ControlSocket") ||
      contains(sshOutput, "mux_client")) {
    return TunnelError(TunnelErrorCode::SESSION_CLOSED, detail);
  }
  if (contains(sshOutput, "Session open refused") ||
      contains(sshOutput, "MaxSessions") ||
      contains(sshOutput, "too many sessions")) {
    return TunnelError(TunnelErrorCode::CHANNEL_LIMIT_EXCEEDED, detail);
  }
  return TunnelError(TunnelErrorCode::REMOTE_REFUSED, detail);
}

SshTunnelSession::SshTunnelSession(const TunnelEndpoint& _endpoint,
                                   shared_ptr<SubprocessUtils> _subprocessUtils,
                                   int64_t _channelOpenGraceMs)
    : TunnelSession(_endpoint),
      subprocessUtils(_subprocessUtils),
      channelOpenGraceMs(_channelOpenGraceMs),
      masterPid(-1) {
  string base = GetTempDirectory() + "kvt_" + genRandomAlphaNum(16);
  controlPath = base + ".sock";
  logPath = base + ".log";
}

SshTunnelSession::~SshTunnelSession() { close(); }

void SshTunnelSession::appendCommonArgs(vector<string>* args) const {
  if (endpoint.has_user() && !endpoint.user().empty()) {
    args->push_back("-l");
    args->push_back(endpoint.user());
  }
  args->push_back("-p");
  args->push_back(to_string(endpoint.port()));
}

vector<string> SshTunnelSession::buildMasterArgs() const {
  int64_t connectTimeoutSeconds =
      std::max<int64_t>(1, (endpoint.connect_timeout_ms() + 999) / 1000);
  vector<string> args = {
      "-M",
      "-N",
      "-S",
      controlPath,
      "-o",
      "ControlPersist=no",
      "-o",
      "BatchMode=yes",
      "-o",
      "ConnectTimeout=" + to_string(connectTimeoutSeconds),
      "-o",
      "ServerAliveInterval=5",
      "-o",
      "ServerAliveCountMax=3",
      "-o",
      "ExitOnForwardFailure=yes",
  };
  if (endpoint.accept_new_host_keys()) {
    args.push_back("-o");
    args.push_back("StrictHostKeyChecking=accept-new");
  }
  if (!endpoint.identity_file().empty()) {
    args.push_back("-i");
    args.push_back(endpoint.identity_file());
    args.push_back("-o");
    args.push_back("IdentitiesOnly=yes");
  }
  for (auto& option : endpoint.ssh_options()) {
    args.push_back("-o");
    args.push_back(option);
  }
  appendCommonArgs(&args);
  args.push_back(endpoint.host());
  return args;
}

vector<string> SshTunnelSession::buildChannelArgs(
    const TargetEndpoint& target) const {
  vector<string> args = {"-S", controlPath, "-o", "BatchMode=yes",
                         "-W", formatForwardTarget(target)};
  appendCommonArgs(&args);
  args.push_back(endpoint.host());
  return args;
}

vector<string> SshTunnelSession::buildExitArgs() const {
  vector<string> args = {"-S", controlPath, "-O", "exit"};
  appendCommonArgs(&args);
  args.push_back(endpoint.host());
  return args;
}

bool SshTunnelSession::controlSocketReady() {
  struct stat st;
  return ::stat(controlPath.c_str(), &st) == 0 && S_ISSOCK(st.st_mode);
}

void SshTunnelSession::removeControlFiles() {
  if (::unlink(controlPath.c_str()) == -1 && errno != ENOENT) {
    LOG(WARNING) << "Could not remove " << controlPath << ": "
                 << strerror(errno);
  }
  ::unlink(logPath.c_str());
}

void SshTunnelSession::establish() {
  int logFd = ::open(logPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     0600);
  FATAL_FAIL(logFd);
  int devNull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
  FATAL_FAIL(devNull);
  auto args = buildMasterArgs();
  VLOG(1) << "Starting ssh control master for session " << id;
  pid_t pid = subprocessUtils->spawn("ssh", args, devNull, devNull, logFd);
  ::close(devNull);
  ::close(logFd);
  if (pid < 0) {
    removeControlFiles();
    throw TunnelError(TunnelErrorCode::NETWORK_UNREACHABLE,
                      "Could not start ssh");
  }
  {
    lock_guard<mutex> guard(processMutex);
    masterPid = pid;
  }

  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(endpoint.connect_timeout_ms());
  while (true) {
    if (controlSocketReady()) {
      VLOG(1) << "Control socket " << controlPath << " is ready";
      return;
    }
    int exitStatus;
    if (subprocessUtils->pollExit(pid, &exitStatus)) {
      {
        lock_guard<mutex> guard(processMutex);
        masterPid = -1;
      }
      string output = readFileContents(logPath);
      removeControlFiles();
      LOG(INFO) << "ssh to " << endpoint << " exited with " << exitStatus
                << ": " << output;
      throw classifySessionFailure(output, exitStatus);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      subprocessUtils->terminate(pid, 1000);
      {
        lock_guard<mutex> guard(processMutex);
        masterPid = -1;
      }
      removeControlFiles();
      throw TunnelError(TunnelErrorCode::TIMEOUT,
                        "No session to " + endpoint.host() + " after " +
                            to_string(endpoint.connect_timeout_ms()) + " ms");
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(SUBPROCESS_POLL_INTERVAL_MS));
  }
}

int SshTunnelSession::openStream(int channelId, const TargetEndpoint& target) {
  int streamFds[2];
  FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, streamFds));
  int errorPipe[2];
  FATAL_FAIL(::pipe2(errorPipe, O_CLOEXEC));

  pid_t pid = subprocessUtils->spawn("ssh", buildChannelArgs(target),
                                     streamFds[1], streamFds[1], errorPipe[1]);
  ::close(streamFds[1]);
  ::close(errorPipe[1]);
  if (pid < 0) {
    ::close(streamFds[0]);
    ::close(errorPipe[0]);
    throw TunnelError(TunnelErrorCode::SESSION_CLOSED,
                      "Could not start ssh forward client");
  }
  int opts = fcntl(errorPipe[0], F_GETFL);
  FATAL_FAIL(opts);
  FATAL_FAIL(fcntl(errorPipe[0], F_SETFL, opts | O_NONBLOCK));

  // A refused forward makes the client exit right away
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(channelOpenGraceMs);
  while (true) {
    int exitStatus;
    if (subprocessUtils->pollExit(pid, &exitStatus)) {
      string output = drainFd(errorPipe[0]);
      ::close(streamFds[0]);
      ::close(errorPipe[0]);
      throw classifyChannelFailure(output, transportAlive());
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(SUBPROCESS_POLL_INTERVAL_MS));
  }

  lock_guard<mutex> guard(processMutex);
  channelProcesses[channelId] = {pid, errorPipe[0], false, 0};
  return streamFds[0];
}

void SshTunnelSession::closeStream(int channelId) {
  ChannelProcess process;
  {
    lock_guard<mutex> guard(processMutex);
    auto it = channelProcesses.find(channelId);
    if (it == channelProcesses.end()) {
      return;
    }
    process = it->second;
    channelProcesses.erase(it);
  }
  if (!process.exited) {
    subprocessUtils->terminate(process.pid, 500);
  }
  ::close(process.stderrFd);
}

ChannelEndReason SshTunnelSession::describeStreamEnd(int channelId) {
  ChannelProcess process;
  {
    lock_guard<mutex> guard(processMutex);
    auto it = channelProcesses.find(channelId);
    if (it == channelProcesses.end()) {
      return ChannelEndReason::ABORTED;
    }
    process = it->second;
  }
  if (!process.exited) {
    // The client closes its stdout right before exiting
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(1000);
    while (!subprocessUtils->pollExit(process.pid, &process.exitStatus)) {
      if (std::chrono::steady_clock::now() >= deadline) {
        LOG(WARNING) << "Forward client for channel " << channelId
                     << " closed its stream but did not exit";
        return ChannelEndReason::ABORTED;
      }
      std::this_thread::sleep_for(
          std::chrono::milliseconds(SUBPROCESS_POLL_INTERVAL_MS));
    }
    process.exited = true;
    lock_guard<mutex> guard(processMutex);
    auto it = channelProcesses.find(channelId);
    if (it != channelProcesses.end()) {
      it->second = process;
    }
  }
  if (process.exitStatus == 0) {
    return ChannelEndReason::GRACEFUL;
  }
  string output = drainFd(process.stderrFd);
  LOG(INFO) << "Forward client for channel " << channelId << " exited with "
            << process.exitStatus << ": " << output;
  if (!transportAlive()) {
    return ChannelEndReason::SESSION_BROKEN;
  }
  if (classifyChannelFailure(output, true).getCode() ==
      TunnelErrorCode::SESSION_CLOSED) {
    return ChannelEndReason::SESSION_BROKEN;
  }
  return ChannelEndReason::ABORTED;
}

bool SshTunnelSession::transportAlive() {
  lock_guard<mutex> guard(processMutex);
  if (masterPid < 0) {
    return false;
  }
  int exitStatus;
  if (subprocessUtils->pollExit(masterPid, &exitStatus)) {
    LOG(WARNING) << "ssh control master for session " << id
                 << " exited with " << exitStatus << ": "
                 << readFileContents(logPath);
    masterPid = -1;
    return false;
  }
  return true;
}

void SshTunnelSession::teardown() {
  map<int, ChannelProcess> leftovers;
  pid_t pid;
  {
    lock_guard<mutex> guard(processMutex);
    leftovers.swap(channelProcesses);
    pid = masterPid;
    masterPid = -1;
  }
  for (auto& it : leftovers) {
    if (!it.second.exited) {
      subprocessUtils->terminate(it.second.pid, 500);
    }
    ::close(it.second.stderrFd);
  }
  if (pid > 0) {
    string output;
    int rc = subprocessUtils->runAndCapture("ssh", buildExitArgs(), &output);
    VLOG(1) << "ssh -O exit returned " << rc << ": " << output;
    subprocessUtils->terminate(pid, 2000);
  }
  removeControlFiles();
}
}  // namespace kvt
