#ifndef __PCD_HEADERS__
#define __PCD_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <resolv.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "PcDaemon.pb.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// The device/script protocol version supported by this binary
static const int PROTOCOL_VERSION = 1;

// Port used when neither the command line nor the config file sets one
const int DEFAULT_DAEMON_PORT = 2600;

// A registered device that stays silent for longer than this (in seconds) is
// considered disconnected.  Devices are expected to send a keepalive at least
// every DEVICE_KEEP_ALIVE_INTERVAL seconds.
const int DEVICE_KEEP_ALIVE_INTERVAL = 10;
const int DEVICE_KEEP_ALIVE_TIMEOUT = 30;

// Process exit statuses
const int EXIT_CODE_BAD_ARGUMENTS = 1;
const int EXIT_CODE_LOCAL_ADDRESS = 2;
const int EXIT_CODE_BIND_FAILURE = 3;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// For calls that return an error number instead of setting errno.
#define FATAL_FAIL_UNLESS_ZERO(X)                                       \
  {                                                                     \
    int __pcd_rc = (X);                                                 \
    if (__pcd_rc != 0)                                                  \
      STFATAL << "Error: (" << __pcd_rc << "): " << strerror(__pcd_rc); \
  }

#ifndef PCD_VERSION
#define PCD_VERSION "unknown"
#endif

namespace pcd {
/**
 * @brief Thrown when the daemon cannot reach the listening state.  Carries the
 * process exit status that main() should terminate with.
 */
class StartupError : public std::runtime_error {
 public:
  StartupError(const string &what, int _exitCode)
      : std::runtime_error(what), exitCode(_exitCode) {}

  int getExitCode() const { return exitCode; }

 protected:
  int exitCode;
};

/** @brief Milliseconds since the unix epoch. */
inline int64_t nowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/**
 * @brief Formats the span between two millisecond timestamps as
 * "[Nd ]HH:MM:SS".
 */
inline string timestampDifference(int64_t fromMillis, int64_t toMillis) {
  int64_t seconds = (toMillis - fromMillis) / 1000;
  if (seconds < 0) {
    seconds = 0;
  }
  int64_t days = seconds / 86400;
  seconds %= 86400;
  char buf[32];
  snprintf(buf, sizeof(buf), "%02d:%02d:%02d", int(seconds / 3600),
           int((seconds % 3600) / 60), int(seconds % 60));
  if (days > 0) {
    return to_string(days) + "d " + buf;
  }
  return string(buf);
}

inline string timestampDifferenceNow(int64_t fromMillis) {
  return timestampDifference(fromMillis, nowMillis());
}

/**
 * @brief Waits until the fd is readable (data, end of file or error).
 * Uses poll() so descriptors above FD_SETSIZE are fine.
 * @return false on timeout or when the fd is no longer valid.
 */
inline bool waitOnSocketData(int fd, int timeoutMs = 1000) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc == -1) {
    if (GetErrno() == EINTR) {
      return false;
    }
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());
  }
  if (rc == 0 || (pfd.revents & POLLNVAL)) {
    return false;
  }
  return true;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace pcd

#endif  // __PCD_HEADERS__
