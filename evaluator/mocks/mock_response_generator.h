#include <gmock/gmock.h>

#include "response_generator.h"

namespace evaluator {

class MockResponseGenerator : public ResponseGenerator {
 public:
  MOCK_METHOD1(Generate, GenerationResult(const GenerationRequest& request));
};

} // namespace evaluator
