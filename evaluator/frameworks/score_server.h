#ifndef _SCORE_SERVER_H_
#define _SCORE_SERVER_H_

#include <mutex>
#include <string>

#include <sys/types.h>

using namespace std;

namespace evaluator {
namespace frameworks {

/**
 * Child process wrapping an external scoring library. Requests and responses
 * are single lines exchanged over the child's stdin and stdout.
 *
 * The channel is shared: concurrent requests are serialized. A response that
 * does not arrive within the timeout leaves the channel out of sync, so every
 * later request fails as well. A server that exits is reported as an error,
 * never through SIGPIPE.
 */
class ScoreServer {
 public:
  // Starts the command through /bin/sh. A timeout of 0 waits forever.
  ScoreServer(const string& command, int timeout_ms);

  virtual ~ScoreServer();

  // Sends the request and returns the response line without the newline.
  // Throws ScoreServerError on failure.
  virtual string RequestResponse(const string& request);

 protected:
  // For testing only.
  ScoreServer();

 private:
  void WriteLine(const string& line);

  string ReadLine();

  void Shutdown();

  string command;
  int timeout_ms;
  pid_t child_pid;
  int to_child;
  int from_child;
  bool broken;
  string pending;
  mutex channel_lock;
};

} // namespace frameworks
} // namespace evaluator

#endif
