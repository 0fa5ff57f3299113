#include <cxxopts.hpp>

#include "DaemonCreator.hpp"
#include "DaemonServer.hpp"
#include "LogHandler.hpp"
#include "SimpleIni.h"
#include "TcpSocketHandler.hpp"

using namespace pcd;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::init(&argc, &argv);

  pcd::HandleTerminate();

  cxxopts::Options options("pcdaemon",
                           "Routes local scripts and remote devices");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on",
         cxxopts::value<int>()->default_value("0"))  //
        ("allremote",
         "Treat every connection as a remote device, even from this host")  //
        ("lanaddress",
         "Address to consider local instead of resolving the host name",
         cxxopts::value<string>()->default_value(""))  //
        ("daemon", "Daemonize the server")             //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("pidfile", "Location of the pid file",
         cxxopts::value<std::string>()->default_value(
             "/var/run/pcdaemon.pid"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "pcdaemon version " << PCD_VERSION << endl;
      exit(0);
    }

    if (result.count("daemon")) {
      DaemonCreator::daemonize(result["pidfile"].as<string>());
    }

    LogFileOptions logOptions;
    logOptions.directory = GetTempDirectory() + "pcdaemon";
    logOptions.prefix = "pcdaemon";
    logOptions.toStdout = result.count("logtostdout") > 0;
    logOptions.captureStderr = !logOptions.toStdout;

    int port = 0;
    bool allRemote = false;
    int verboseLevel = result["verbose"].as<int>();
    bool silent = false;
    string lanAddress = "";
    if (result.count("cfgfile")) {
      CSimpleIniA ini(true, false, false);
      string cfgfilename = result["cfgfile"].as<string>();
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc == 0) {
        const char *portString = ini.GetValue("Networking", "port", NULL);
        if (portString) {
          port = atoi(portString);
        }
        allRemote = ini.GetBoolValue("Networking", "allow_remote", false);
        const char *lanAddressPtr =
            ini.GetValue("Networking", "lan_address", NULL);
        if (lanAddressPtr) {
          lanAddress = string(lanAddressPtr);
        }

        // The command line verbose level wins over the config file
        const char *vlevel = ini.GetValue("Debug", "verbose", NULL);
        if (vlevel && !result.count("verbose")) {
          verboseLevel = atoi(vlevel);
        }
        silent = ini.GetLongValue("Debug", "silent", 0) != 0;
        long logsize = ini.GetLongValue("Debug", "logsize", 0);
        if (logsize > 0) {
          logOptions.maxSize = to_string(logsize);
        }
      } else {
        CLOG(INFO, "stdout") << "Invalid config file: " << cfgfilename
                             << endl;
        exit(EXIT_CODE_BAD_ARGUMENTS);
      }
    }
    LogHandler::setVerbosity(&defaultConf, verboseLevel, silent);

    if (result.count("port")) {
      port = result["port"].as<int>();
    }
    if (result.count("allremote")) {
      allRemote = true;
    }
    if (result.count("lanaddress")) {
      lanAddress = result["lanaddress"].as<string>();
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if (port == 0) {
      port = DEFAULT_DAEMON_PORT;
    }
    if (port < 0 || port > 65535) {
      CLOG(INFO, "stdout") << "Invalid port: " << port << endl;
      exit(EXIT_CODE_BAD_ARGUMENTS);
    }

    LogHandler::logToFiles(&defaultConf, logOptions);
    el::Helpers::setThreadName("pcdaemon-main");

    // Handle SIGINT/SIGTERM on this thread only.  The mask is inherited by
    // every thread the server starts.
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    FATAL_FAIL_UNLESS_ZERO(pthread_sigmask(SIG_BLOCK, &stopSignals, NULL));
    ::signal(SIGPIPE, SIG_IGN);

    std::shared_ptr<SocketHandler> tcpSocketHandler(new TcpSocketHandler());
    DaemonServer daemonServer(tcpSocketHandler, SocketEndpoint(port));
    daemonServer.setAllRemoteConnections(allRemote);
    if (!lanAddress.empty()) {
      daemonServer.setLocalAddressOverride(lanAddress);
    }

    try {
      daemonServer.listen();
    } catch (const StartupError &se) {
      LOG(ERROR) << "Startup failed: " << se.what();
      CLOG(INFO, "stdout") << se.what() << endl;
      exit(se.getExitCode());
    }

    thread acceptThread([&daemonServer]() {
      el::Helpers::setThreadName("accept-loop");
      daemonServer.run();
    });

    int signum = 0;
    FATAL_FAIL_UNLESS_ZERO(sigwait(&stopSignals, &signum));
    LOG(INFO) << "Got signal " << signum << ", stopping";
    daemonServer.stop();
    acceptThread.join();
    LOG(INFO) << "Server stopped after "
              << timestampDifferenceNow(daemonServer.getStartTimestamp());
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(EXIT_CODE_BAD_ARGUMENTS);
  }

  LogHandler::finish();
  return 0;
}
