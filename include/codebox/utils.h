#ifndef INCLUDE_CODEBOX_UTILS_H_
#define INCLUDE_CODEBOX_UTILS_H_

#include <string>

#include "namespace.h"
#include "submission.h"

long GetUniqueSubmissionInternalId();

const char* ViolationRuleName(ViolationRule);
const char* ResourceKindName(ResourceKind);
const char* ErrorKindName(ErrorKind);
const char* CapabilityKindName(CapabilityKind);

// logging
const char* SubmissionStateName(SubmissionState);

#endif  // INCLUDE_CODEBOX_UTILS_H_
