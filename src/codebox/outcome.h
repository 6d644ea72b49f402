#ifndef CODEBOX_OUTCOME_H_
#define CODEBOX_OUTCOME_H_

#include <string>
#include <vector>
#include <optional>

#include <codebox/submission.h>
#include "broker.h"

// Everything the executor observed about one run, before classification
struct RunRecord {
  // non-empty if the jail was never set up; no user code ran
  std::string setup_error;
  double elapsed; // wall seconds since spawn
  // the watchdog or the cjail wall limit ended the run
  bool deadline_hit;
  bool oom_killed;
  bool cpu_exceeded;
  // false if sandbox-exec died before reporting how the jailed program ended
  bool reported;
  int exit_code;
  int term_signal; // 0 if the program exited
  std::optional<FinishReport> finish;
  // bounded, with markers; stderr already appended
  std::string output;
  std::vector<ArtifactDescriptor> artifacts;

  RunRecord() :
      elapsed(0), deadline_hit(false), oom_killed(false), cpu_exceeded(false),
      reported(false), exit_code(0), term_signal(0) {}
};

// "Type: message (line N)", bounded; never a traceback
std::string FormatExceptionSummary(const std::string& type, const std::string& message, int line);

// Total over every way a run can end. Pure.
ExecutionOutcome ClassifyOutcome(const RunRecord&);

#endif  // CODEBOX_OUTCOME_H_
