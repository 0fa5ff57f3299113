#ifndef __PCD_LOG_HANDLER__
#define __PCD_LOG_HANDLER__

#include "Headers.hpp"

namespace pcd {
/**
 * @brief Where the default logger writes once startup is done.
 */
struct LogFileOptions {
  string directory;
  string prefix;
  // Also copy every line to stdout
  bool toStdout = false;
  // Send stderr into its own file next to the log
  bool captureStderr = false;
  // Bytes before a file is rolled out
  string maxSize = "20971520";
};

/**
 * @brief Configures easylogging++ for pcdaemon, pcdctl and the tests.
 *
 * Every program calls init() first.  That sets the shared line format and a
 * bare "stdout" logger used for user facing output.  The default logger is
 * then pointed at files (logToFiles) or kept on the console (logToConsole).
 */
class LogHandler {
 public:
  static el::Configurations init(int *argc, char ***argv);

  /**
   * @brief Applies a verbose level, or turns the default logger off.
   */
  static void setVerbosity(el::Configurations *conf, int level, bool silent);

  /**
   * @brief Writes the default logger to a fresh timestamped file in
   * options.directory and installs size based roll out.
   * @return The path of the log file.
   */
  static string logToFiles(el::Configurations *conf,
                           const LogFileOptions &options);

  static void logToConsole(el::Configurations *conf, bool toStdout);

  /**
   * @brief Removes the roll out hook.  Call before exiting normally.
   */
  static void finish();

 private:
  static void rollOut(const char *filename, std::size_t size);
  static string createLogFile(const string &directory, const string &name);
};
}  // namespace pcd
#endif  // __PCD_LOG_HANDLER__
