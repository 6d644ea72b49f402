#ifndef INCLUDE_CODEBOX_EXECUTOR_H_
#define INCLUDE_CODEBOX_EXECUTOR_H_

#include <string>

#include "namespace.h"
#include "submission.h"

// seconds between SIGTERM and SIGKILL after a timeout
extern double kGraceSeconds;
// stdout/stderr capture ceiling, bytes
extern long kMaxOutputBytes;
// size of the writable scratch area, KiB
extern long kScratchKiB;

// Clamp a request to the hard maxima; unset fields take the defaults
ResourceLimits ResolveLimits(const LimitOverrides&);
ResourceLimits ClampLimits(const ResourceLimits&);

// Run validated code in a fresh jailed process. Blocks until the process is gone.
ExecutionOutcome Execute(const std::string& code, const ExecutionContext&, const ResourceLimits&);

// number of jailed processes spawned by this process so far
long ExecutionsStarted();

#endif  // INCLUDE_CODEBOX_EXECUTOR_H_
