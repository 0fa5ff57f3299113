#include "DaemonCreator.hpp"

namespace pcd {
void DaemonCreator::daemonize(const string &pidFile) {
  forkAndExitParent();
  // New session, no controlling terminal
  FATAL_FAIL(setsid());
  signal(SIGHUP, SIG_IGN);
  // The session leader exits so the daemon can never reacquire a terminal
  forkAndExitParent();

  if (!pidFile.empty()) {
    writePidFile(pidFile);
  }
  FATAL_FAIL(chdir("/"));
  detachStdio();
}

void DaemonCreator::forkAndExitParent() {
  pid_t pid = fork();
  FATAL_FAIL(pid);
  if (pid > 0) {
    _exit(EXIT_SUCCESS);
  }
}

void DaemonCreator::writePidFile(const string &pidFile) {
  int fd = ::open(pidFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd == -1) {
    STFATAL << "Cannot open pid file " << pidFile << ": "
            << strerror(GetErrno());
  }
  string contents = to_string(getpid()) + "\n";
  if (::write(fd, contents.c_str(), contents.length()) !=
      ssize_t(contents.length())) {
    STFATAL << "Cannot write pid file " << pidFile;
  }
  FATAL_FAIL(::close(fd));
}

void DaemonCreator::detachStdio() {
  int nullIn = ::open("/dev/null", O_RDONLY);
  FATAL_FAIL(nullIn);
  int nullOut = ::open("/dev/null", O_WRONLY);
  FATAL_FAIL(nullOut);
  FATAL_FAIL(dup2(nullIn, STDIN_FILENO));
  FATAL_FAIL(dup2(nullOut, STDOUT_FILENO));
  FATAL_FAIL(dup2(nullOut, STDERR_FILENO));
  if (nullIn > STDERR_FILENO) ::close(nullIn);
  if (nullOut > STDERR_FILENO) ::close(nullOut);
}
}  // namespace pcd
