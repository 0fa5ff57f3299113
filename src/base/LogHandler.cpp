#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace pcd {
namespace {
string startTimeString() {
  char buffer[80];
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &local);
  return string(buffer);
}
}  // namespace

el::Configurations LogHandler::init(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // %thread prints the name given by setThreadName
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");

  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), stdoutConf);
  return conf;
}

void LogHandler::setVerbosity(el::Configurations *conf, int level,
                              bool silent) {
  el::Loggers::setVerboseLevel(level);
  conf->setGlobally(el::ConfigurationType::Enabled, silent ? "false" : "true");
}

string LogHandler::logToFiles(el::Configurations *conf,
                              const LogFileOptions &options) {
  string suffix = startTimeString() + ".log";
  string logPath =
      createLogFile(options.directory, options.prefix + "-" + suffix);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::Filename, logPath);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize, options.maxSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    options.toStdout ? "true" : "false");

  if (options.captureStderr) {
    string stderrPath = createLogFile(options.directory,
                                      options.prefix + "-stderr-" + suffix);
    FILE *stream = freopen(stderrPath.c_str(), "w", stderr);
    if (!stream) {
      STFATAL << "Cannot redirect stderr to " << stderrPath;
    }
    setvbuf(stream, NULL, _IOLBF, BUFSIZ);
  }

  el::Loggers::reconfigureLogger("default", *conf);
  el::Helpers::installPreRollOutCallback(LogHandler::rollOut);
  return logPath;
}

void LogHandler::logToConsole(el::Configurations *conf, bool toStdout) {
  conf->setGlobally(el::ConfigurationType::ToFile, "false");
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    toStdout ? "true" : "false");
  el::Loggers::reconfigureLogger("default", *conf);
}

void LogHandler::finish() { el::Helpers::uninstallPreRollOutCallback(); }

void LogHandler::rollOut(const char *filename, std::size_t) {
  // The log file is closed here, so nothing may be logged
  remove(filename);
}

string LogHandler::createLogFile(const string &directory, const string &name) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << directory
                          << ": " << ec.message() << endl;
    exit(EXIT_CODE_BAD_ARGUMENTS);
  }
  string path = directory + "/" + name;
  int fd = ::open(path.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT | O_WRONLY, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return path;
}
}  // namespace pcd
