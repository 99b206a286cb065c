#include "score_server.h"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "evaluation_error.h"
#include "verbosity.h"

namespace evaluator {
namespace frameworks {

namespace {

// Longest response line accepted from the server.
const size_t MAX_LINE_LENGTH = 1 << 20;

string SystemError(const string& operation) {
  return operation + ": " + strerror(errno);
}

// Blocks SIGPIPE for the calling thread while writing to the child, so that a
// dead server shows up as EPIPE. A SIGPIPE raised by the write is discarded
// before the previous signal mask is restored.
class PipeSignalBlocker {
 public:
  PipeSignalBlocker() {
    sigemptyset(&pipe_signal);
    sigaddset(&pipe_signal, SIGPIPE);
    sigset_t pending;
    sigpending(&pending);
    was_pending = sigismember(&pending, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_signal, &old_mask);
  }

  ~PipeSignalBlocker() {
    if (!was_pending) {
      sigset_t pending;
      sigpending(&pending);
      if (sigismember(&pending, SIGPIPE)) {
        timespec no_wait = {0, 0};
        while (sigtimedwait(&pipe_signal, NULL, &no_wait) < 0 &&
               errno == EINTR) {}
      }
    }
    pthread_sigmask(SIG_SETMASK, &old_mask, NULL);
  }

 private:
  sigset_t pipe_signal;
  sigset_t old_mask;
  bool was_pending;
};

} // namespace

ScoreServer::ScoreServer() :
    timeout_ms(0), child_pid(-1), to_child(-1), from_child(-1),
    broken(false) {}

ScoreServer::ScoreServer(const string& command, int timeout_ms) :
    command(command), timeout_ms(timeout_ms), child_pid(-1), to_child(-1),
    from_child(-1), broken(false) {
  int parent_to_child[2], child_to_parent[2];
  if (pipe(parent_to_child) < 0) {
    throw ScoreServerError(SystemError("pipe"));
  }
  if (pipe(child_to_parent) < 0) {
    close(parent_to_child[0]);
    close(parent_to_child[1]);
    throw ScoreServerError(SystemError("pipe"));
  }

  if (IsVerbose()) {
    cerr << "Invoking " << command << " ..." << endl;
  }
  child_pid = fork();
  if (child_pid < 0) {
    close(parent_to_child[0]);
    close(parent_to_child[1]);
    close(child_to_parent[0]);
    close(child_to_parent[1]);
    throw ScoreServerError(SystemError("fork"));
  }

  if (child_pid == 0) {
    dup2(parent_to_child[0], STDIN_FILENO);
    dup2(child_to_parent[1], STDOUT_FILENO);
    close(parent_to_child[0]);
    close(parent_to_child[1]);
    close(child_to_parent[0]);
    close(child_to_parent[1]);
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(NULL));
    _exit(127);
  }

  close(parent_to_child[0]);
  close(child_to_parent[1]);
  to_child = parent_to_child[1];
  from_child = child_to_parent[0];
}

ScoreServer::~ScoreServer() {
  Shutdown();
}

string ScoreServer::RequestResponse(const string& request) {
  lock_guard<mutex> lock(channel_lock);
  if (broken) {
    throw ScoreServerError("score server '" + command + "' is unavailable");
  }
  try {
    WriteLine(request);
    return ReadLine();
  } catch (const ScoreServerError&) {
    broken = true;
    throw;
  }
}

void ScoreServer::WriteLine(const string& line) {
  string data = line + "\n";
  PipeSignalBlocker blocker;
  size_t written = 0;
  while (written < data.size()) {
    ssize_t result = write(to_child, data.data() + written,
                           data.size() - written);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EPIPE) {
        throw ScoreServerError("score server closed the connection");
      }
      throw ScoreServerError(SystemError("write to score server"));
    }
    written += result;
  }
}

string ScoreServer::ReadLine() {
  size_t newline;
  while ((newline = pending.find('\n')) == string::npos) {
    pollfd descriptor;
    descriptor.fd = from_child;
    descriptor.events = POLLIN;
    descriptor.revents = 0;
    int ready = poll(&descriptor, 1, timeout_ms > 0 ? timeout_ms : -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ScoreServerError(SystemError("poll score server"));
    }
    if (ready == 0) {
      throw ScoreServerError("score server timed out after " +
                             to_string(timeout_ms) + " ms");
    }

    char buffer[4096];
    ssize_t result = read(from_child, buffer, sizeof(buffer));
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw ScoreServerError(SystemError("read from score server"));
    }
    if (result == 0) {
      throw ScoreServerError("score server closed the connection");
    }
    pending.append(buffer, result);
    if (pending.find('\n') == string::npos &&
        pending.size() > MAX_LINE_LENGTH) {
      throw ScoreServerError("score server response is longer than " +
                             to_string(MAX_LINE_LENGTH) + " bytes");
    }
  }

  string line = pending.substr(0, newline);
  pending.erase(0, newline + 1);
  if (!line.empty() && line[line.size() - 1] == '\r') {
    line.erase(line.size() - 1);
  }
  return line;
}

void ScoreServer::Shutdown() {
  if (to_child >= 0) {
    close(to_child);
    to_child = -1;
  }
  if (from_child >= 0) {
    close(from_child);
    from_child = -1;
  }
  if (child_pid > 0) {
    kill(child_pid, SIGTERM);
    int status;
    waitpid(child_pid, &status, 0);
    child_pid = -1;
  }
}

} // namespace frameworks
} // namespace evaluator
