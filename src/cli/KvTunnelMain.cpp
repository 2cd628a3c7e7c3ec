#include <cxxopts.hpp>

#include "CommandRunner.hpp"
#include "ConnectionPool.hpp"
#include "DirectConnectionFactory.hpp"
#include "EndpointUtils.hpp"
#include "LogHandler.hpp"
#include "PoolConfigLoader.hpp"
#include "TunneledConnectionPool.hpp"

using namespace kvt;

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  kvt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, kvt::InterruptSignalHandler);

  cxxopts::Options options(
      "kvtunnel", "Sends store commands through a tunneled connection pool");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("tunnel", "Intermediary host: [user@]host[:port]",
         cxxopts::value<string>())                                  //
        ("target", "Store endpoint as seen from the intermediary host",
         cxxopts::value<string>())                                  //
        ("identity", "Private key used to authenticate",
         cxxopts::value<string>())                                  //
        ("ssh-option", "Extra ssh -o option (may be repeated)",
         cxxopts::value<std::vector<string>>())                     //
        ("shared", "Multiplex all connections over one session",
         cxxopts::value<bool>())                                    //
        ("max-connections", "Maximum pooled connections",
         cxxopts::value<int>())                                     //
        ("acquire-timeout", "Milliseconds to wait for a free connection",
         cxxopts::value<int64_t>())                                 //
        ("reopen-wait",
         "Milliseconds to wait on a shared session reopen (-1: no bound)",
         cxxopts::value<int64_t>())                                 //
        ("socket-timeout", "Milliseconds per read/write (-1: block)",
         cxxopts::value<int64_t>())                                 //
        ("direct", "Connect straight to the target without a tunnel")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<string>())                                  //
        ("logtostdout", "Write log messages to stdout")             //
        ("logdir", "Directory for log files",
         cxxopts::value<string>()->default_value(GetTempDirectory() +
                                                 "kvtunnel"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "kvtunnel version " << KVT_VERSION << endl;
      exit(0);
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    PoolConfig config;
    int verbosity = 0;
    if (result.count("cfgfile")) {
      PoolConfigLoader::loadFile(result["cfgfile"].as<string>(), &config,
                                 &verbosity);
    }
    // Command line values win over the config file
    if (result.count("verbose")) {
      verbosity = result["verbose"].as<int>();
    }
    if (result.count("tunnel")) {
      auto parsed = parseTunnelEndpoint(result["tunnel"].as<string>());
      auto tunnel = config.mutable_tunnel();
      tunnel->set_host(parsed.host());
      if (parsed.has_port()) {
        tunnel->set_port(parsed.port());
      }
      if (parsed.has_user()) {
        tunnel->set_user(parsed.user());
      }
    }
    if (result.count("target")) {
      *(config.mutable_target()) =
          parseTargetEndpoint(result["target"].as<string>());
    }
    if (result.count("identity")) {
      config.mutable_tunnel()->set_identity_file(
          result["identity"].as<string>());
    }
    if (result.count("ssh-option")) {
      for (auto& option : result["ssh-option"].as<std::vector<string>>()) {
        config.mutable_tunnel()->add_ssh_options(option);
      }
    }
    if (result.count("shared")) {
      config.set_shared(result["shared"].as<bool>());
    }
    if (result.count("max-connections")) {
      config.set_max_connections(result["max-connections"].as<int>());
    }
    if (result.count("acquire-timeout")) {
      config.set_acquire_timeout_ms(result["acquire-timeout"].as<int64_t>());
    }
    if (result.count("reopen-wait")) {
      config.set_reopen_wait_ms(result["reopen-wait"].as<int64_t>());
    }
    if (result.count("socket-timeout")) {
      config.set_socket_timeout_ms(result["socket-timeout"].as<int64_t>());
    }

    bool direct = result.count("direct") > 0;
    if (!direct) {
      applyTunnelDefaults(config.mutable_tunnel());
    }
    PoolConfigLoader::validate(config, !direct);

    string logFile = LogHandler::setupLogFiles(
        &defaultConf, result["logdir"].as<string>(), "kvtunnel",
        result.count("logtostdout") > 0, true);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("kvtunnel-main");
    LogHandler::setVerbosity(verbosity);
    LOG(INFO) << "kvtunnel " << KVT_VERSION << " logging to " << logFile;

    shared_ptr<ConnectionPool> pool;
    if (direct) {
      pool = make_shared<ConnectionPool>(
          make_shared<DirectConnectionFactory>(
              config.target(), config.socket_timeout_ms(),
              config.tunnel().connect_timeout_ms()),
          config.max_connections(), config.acquire_timeout_ms());
    } else {
      pool = make_shared<TunneledConnectionPool>(config);
    }

    CommandRunner runner(pool.get());
    string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        continue;
      }
      vector<string> reply;
      bool keepGoing = runner.run(line, &reply);
      for (auto& replyLine : reply) {
        CLOG(INFO, "stdout") << replyLine << endl;
      }
      if (!keepGoing) {
        break;
      }
    }

    auto stats = pool->getStats();
    LOG(INFO) << "Pool stats: created " << stats.created << ", discarded "
              << stats.discarded << ", session opens "
              << stats.sessionOpenAttempts << ", reopens "
              << stats.sessionReopens;
    pool->shutdown();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const EndpointParseException& epe) {
    CLOG(INFO, "stdout") << "Invalid endpoint: " << epe.what() << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }

  return 0;
}
