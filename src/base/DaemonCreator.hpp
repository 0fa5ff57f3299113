#ifndef __PCD_DAEMON_CREATOR__
#define __PCD_DAEMON_CREATOR__

#include "Headers.hpp"

namespace pcd {
/**
 * @brief Turns the calling process into a background daemon.
 */
class DaemonCreator {
 public:
  /**
   * @brief Detaches from the terminal with a double fork.  Only the daemon
   * returns; both intermediate processes exit.  Writes the daemon's pid to
   * pidFile unless it is empty.
   */
  static void daemonize(const string &pidFile);

 private:
  static void forkAndExitParent();
  static void writePidFile(const string &pidFile);
  static void detachStdio();
};
}  // namespace pcd

#endif  // __PCD_DAEMON_CREATOR__
