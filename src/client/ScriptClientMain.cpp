#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "ScriptClient.hpp"
#include "TcpSocketHandler.hpp"

using namespace pcd;

namespace {
void printDevices(const ScriptResponse& response) {
  for (const auto& device : response.devices()) {
    CLOG(INFO, "stdout") << device.uniqueidentifier() << "\t"
                         << (device.active() ? "active" : "inactive")
                         << "\tconnected for "
                         << timestampDifferenceNow(device.timestampconnected())
                         << endl;
  }
}
}  // namespace

int main(int argc, char** argv) {
  el::Configurations defaultConf = LogHandler::init(&argc, &argv);

  pcd::HandleTerminate();

  cxxopts::Options options("pcdctl", "Query and control a running pcdaemon");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Daemon host",
         cxxopts::value<string>()->default_value("127.0.0.1"))  //
        ("port", "Daemon port",
         cxxopts::value<int>()->default_value(to_string(DEFAULT_DAEMON_PORT)))  //
        ("status", "Print daemon status")                                      //
        ("list", "List registered devices")                                    //
        ("device", "Print the status of one device",
         cxxopts::value<string>())  //
        ("send", "Send a message to a device", cxxopts::value<string>(),
         "ID")  //
        ("payload", "Message for --send",
         cxxopts::value<string>()->default_value(""))  //
        ("disconnect", "Disconnect a device", cxxopts::value<string>(),
         "ID")  //
        ("logtostdout", "log to stdout")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "pcdctl version " << PCD_VERSION << endl;
      exit(0);
    }

    LogHandler::setVerbosity(&defaultConf, result["verbose"].as<int>(), false);
    LogHandler::logToConsole(&defaultConf, result.count("logtostdout") > 0);

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    ::signal(SIGPIPE, SIG_IGN);

    std::shared_ptr<SocketHandler> socketHandler(new TcpSocketHandler());
    ScriptClient client(
        socketHandler,
        SocketEndpoint(result["host"].as<string>(), result["port"].as<int>()));
    if (!client.connect()) {
      CLOG(INFO, "stdout") << "Could not reach pcdaemon on "
                           << result["host"].as<string>() << ":"
                           << result["port"].as<int>() << endl;
      exit(1);
    }

    ScriptResponse response;
    try {
      if (result.count("device")) {
        response = client.deviceStatus(result["device"].as<string>());
        printDevices(response);
      } else if (result.count("list")) {
        response = client.listDevices();
        printDevices(response);
      } else if (result.count("send")) {
        response = client.sendToDevice(result["send"].as<string>(),
                                       result["payload"].as<string>());
      } else if (result.count("disconnect")) {
        response = client.disconnectDevice(result["disconnect"].as<string>());
      } else {
        response = client.serverStatus();
        if (response.success()) {
          CLOG(INFO, "stdout")
              << "Local address: " << response.localaddress() << endl
              << "Up for: " << timestampDifferenceNow(response.starttimestamp())
              << endl
              << "Devices: " << response.devicecount() << endl
              << "Connections: " << response.connectioncount() << endl;
        }
      }
    } catch (const std::runtime_error& re) {
      CLOG(INFO, "stdout") << "Error talking to pcdaemon: " << re.what()
                           << endl;
      exit(1);
    }
    client.close();

    if (!response.success()) {
      CLOG(INFO, "stdout") << "Error: " << response.error() << endl;
      exit(1);
    }
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(EXIT_CODE_BAD_ARGUMENTS);
  }
  return 0;
}
