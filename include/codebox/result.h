#ifndef INCLUDE_CODEBOX_RESULT_H_
#define INCLUDE_CODEBOX_RESULT_H_

#include <string>

#include "submission.h"

AgentResponse Assemble(const ExecutionOutcome&);
// response for a submission that never reached the executor
AgentResponse Assemble(const ValidationVerdict&);

std::string ResponseToJson(const AgentResponse&, const std::string& request_id = "");

#endif  // INCLUDE_CODEBOX_RESULT_H_
