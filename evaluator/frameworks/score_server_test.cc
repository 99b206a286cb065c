#include <gtest/gtest.h>

#include <string>

#include <unistd.h>

#include "evaluation_error.h"
#include "score_server.h"

using namespace std;
using namespace ::testing;

namespace evaluator {
namespace frameworks {
namespace {

const string ECHO_COMMAND =
    "while read -r line; do echo \"echo $line\"; done";

TEST(ScoreServerTest, TestRequestResponse) {
  ScoreServer server(ECHO_COMMAND, 5000);
  EXPECT_EQ("echo METRICS", server.RequestResponse("METRICS"));
  EXPECT_EQ("echo SCORE ||| q ||| a",
            server.RequestResponse("SCORE ||| q ||| a"));
}

TEST(ScoreServerTest, TestTimeout) {
  ScoreServer server("sleep 5", 50);
  EXPECT_THROW(server.RequestResponse("METRICS"), ScoreServerError);
  // The channel is out of sync after a timeout.
  EXPECT_THROW(server.RequestResponse("METRICS"), ScoreServerError);
}

TEST(ScoreServerTest, TestClosedConnection) {
  ScoreServer server("read -r line; exit 0", 5000);
  EXPECT_THROW(server.RequestResponse("METRICS"), ScoreServerError);
}

TEST(ScoreServerTest, TestServerExitsAfterResponse) {
  ScoreServer server("read -r line; echo faithfulness", 5000);
  EXPECT_EQ("faithfulness", server.RequestResponse("METRICS"));
  usleep(200000);
  // The request does not fit in the pipe buffer of the exited server.
  EXPECT_THROW(server.RequestResponse(string(70000, 'a')), ScoreServerError);
  EXPECT_THROW(server.RequestResponse("METRICS"), ScoreServerError);
}

TEST(ScoreServerTest, TestResponseTooLong) {
  ScoreServer server("yes aaaaaaaaaaaaaaaa | tr -d '\\n'", 10000);
  try {
    server.RequestResponse("METRICS");
    FAIL() << "Expected ScoreServerError";
  } catch (const ScoreServerError& e) {
    EXPECT_NE(string::npos, string(e.what()).find("longer than"));
  }
}

} // namespace
} // namespace frameworks
} // namespace evaluator
