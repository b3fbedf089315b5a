#include <cxxopts.hpp>

#include "ClientConfig.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "MaxClient.hpp"
#include "TcpSocketHandler.hpp"

using namespace mw;

namespace {
std::atomic<bool> interrupted(false);

void interruptSignalHandler(int signum) { interrupted = true; }
}  // namespace

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  mw::HandleTerminate();

  ::signal(SIGINT, interruptSignalHandler);
  ::signal(SIGTERM, interruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  ClientConfig config;

  cxxopts::Options options("maxwire", "Messenger bot client");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Server host name",
         cxxopts::value<std::string>())                               //
        ("p,port", "Server port", cxxopts::value<int>())              //
        ("token", "Session token used to log in",
         cxxopts::value<std::string>())                               //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())                               //
        ("timeout", "Request timeout in milliseconds",
         cxxopts::value<int64_t>())                                   //
        ("logtostdout", "Write log to stdout")                        //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>())                                       //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>());

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "maxwire version " << MW_VERSION << endl;
      exit(0);
    }

    if (result.count("cfgfile")) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        loadClientConfig(cfgfilename, &config);
      } catch (const std::runtime_error& re) {
        CLOG(INFO, "stdout") << re.what() << endl;
        exit(1);
      }
    }

    // Command line flags take priority over the config file
    if (result.count("host")) {
      config.host = result["host"].as<string>();
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("token")) {
      config.token = result["token"].as<string>();
    }
    if (result.count("timeout")) {
      config.timeoutMs = result["timeout"].as<int64_t>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logtostdout")) {
      config.logToStdout = true;
    }
    if (result.count("logdir")) {
      config.logDir = result["logdir"].as<string>();
    }
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  }

  if (config.token.empty()) {
    CLOG(INFO, "stdout") << "Missing token, pass --token or set "
                            "[Connection] token in the config file"
                         << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  el::Loggers::setVerboseLevel(config.verbose);
  LogHandler::setupLogFiles(&defaultConf, config.logDir, "maxwire",
                            config.logToStdout, !config.logToStdout);
  el::Loggers::reconfigureLogger("default", defaultConf);
  el::Helpers::setThreadName("client-main");

  shared_ptr<SocketHandler> socketHandler(new TcpSocketHandler());
  MaxClient client(socketHandler, config);

  client.onConnect([&client]() {
    auto me = client.getMe();
    CLOG(INFO, "stdout") << "Connected as contact "
                         << (me ? me->contact.id : 0) << endl;
  });
  client.onMessage(FilterNode::command("ping"),
                   [](MaxClient& c, const Message& message) {
                     c.reply(message, "pong");
                   });
  client.onMessage(FilterNode::any(),
                   [](MaxClient& c, const Message& message) {
                     LOG(INFO) << "Received " << message << ": "
                               << message.text.value_or("");
                   });

  try {
    client.connect();
  } catch (const std::exception& e) {
    CLOG(INFO, "stdout") << "Could not connect: " << e.what() << endl;
    exit(1);
  }

  while (!interrupted && client.isConnected()) {
    std::this_thread::sleep_for(
        std::chrono::milliseconds(READER_POLL_INTERVAL_MS));
  }
  if (interrupted) {
    LOG(INFO) << "Got interrupt, shutting down";
  } else {
    CLOG(INFO, "stdout") << "Connection to the server was lost" << endl;
  }
  client.stop();

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return interrupted ? 0 : 1;
}
