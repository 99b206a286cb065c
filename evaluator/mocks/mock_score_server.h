#include <gmock/gmock.h>

#include "frameworks/score_server.h"

namespace evaluator {
namespace frameworks {

class MockScoreServer : public ScoreServer {
 public:
  MOCK_METHOD1(RequestResponse, string(const string& request));
};

} // namespace frameworks
} // namespace evaluator
