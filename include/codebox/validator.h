#ifndef INCLUDE_CODEBOX_VALIDATOR_H_
#define INCLUDE_CODEBOX_VALIDATOR_H_

#include <string>

#include "submission.h"

// Static analysis of submitted source. Pure: no execution, no side effects,
// no cache. Fail-closed: anything not provably safe is a violation.
ValidationVerdict Validate(const std::string& source);

#endif  // INCLUDE_CODEBOX_VALIDATOR_H_
