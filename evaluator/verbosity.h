#ifndef _VERBOSITY_H_
#define _VERBOSITY_H_

namespace evaluator {

// Controls the informational progress lines written to stderr. Warnings and
// errors are always written.
void SetVerbose(bool verbose);

bool IsVerbose();

} // namespace evaluator

#endif
