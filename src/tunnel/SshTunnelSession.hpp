#ifndef __KVT_SSH_TUNNEL_SESSION__
#define __KVT_SSH_TUNNEL_SESSION__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"
#include "TunnelSession.hpp"
#include "TunnelSessionFactory.hpp"

namespace kvt {
/**
 * @brief Tunnel session carried by an OpenSSH control master.
 *
 * open() starts `ssh -M -N` with a private control socket and waits for the
 * socket to appear.  Each channel is an `ssh -W host:port` client multiplexed
 * over that master, whose stdin/stdout is one end of a socketpair.
 */
class SshTunnelSession : public TunnelSession {
 public:
  SshTunnelSession(const TunnelEndpoint& _endpoint,
                   shared_ptr<SubprocessUtils> _subprocessUtils,
                   int64_t _channelOpenGraceMs = 200);
  virtual ~SshTunnelSession();

  vector<string> buildMasterArgs() const;
  vector<string> buildChannelArgs(const TargetEndpoint& target) const;
  vector<string> buildExitArgs() const;

  const string& getControlPath() const { return controlPath; }

 protected:
  struct ChannelProcess {
    pid_t pid;
    int stderrFd;
    bool exited;
    int exitStatus;
  };

  virtual void establish();
  virtual int openStream(int channelId, const TargetEndpoint& target);
  virtual void closeStream(int channelId);
  virtual ChannelEndReason describeStreamEnd(int channelId);
  virtual bool transportAlive();
  virtual void teardown();

  bool controlSocketReady();
  void removeControlFiles();
  void appendCommonArgs(vector<string>* args) const;

  shared_ptr<SubprocessUtils> subprocessUtils;
  int64_t channelOpenGraceMs;
  string controlPath;
  string logPath;
  pid_t masterPid;
  mutex processMutex;
  map<int, ChannelProcess> channelProcesses;
};

/**
 * @brief Maps the output of a failed `ssh -M` to a session error.
 */
TunnelError classifySessionFailure(const string& sshOutput, int exitStatus);

/**
 * @brief Maps the output of a failed `ssh -W` client to a channel error.
 * @param masterAlive Whether the control master was still running.
 */
TunnelError classifyChannelFailure(const string& sshOutput, bool masterAlive);

class SshTunnelSessionFactory : public TunnelSessionFactory {
 public:
  SshTunnelSessionFactory(shared_ptr<SubprocessUtils> _subprocessUtils,
                          int _maxChannels, int64_t _channelOpenGraceMs)
      : subprocessUtils(_subprocessUtils),
        maxChannels(_maxChannels),
        channelOpenGraceMs(_channelOpenGraceMs) {}

  virtual shared_ptr<TunnelSession> create(const TunnelEndpoint& endpoint) {
    auto session = make_shared<SshTunnelSession>(endpoint, subprocessUtils,
                                                 channelOpenGraceMs);
    session->setMaxChannels(maxChannels);
    return session;
  }

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
  int maxChannels;
  int64_t channelOpenGraceMs;
};
}  // namespace kvt

#endif  // __KVT_SSH_TUNNEL_SESSION__
