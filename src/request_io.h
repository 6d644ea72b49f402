#ifndef REQUEST_IO_H_
#define REQUEST_IO_H_

#include <string>
#include <istream>
#include <ostream>

#include <codebox/submission.h>

extern size_t kMaxQueue;

// Parse one JSON request line; throws nlohmann::json::exception if malformed
CodeSubmission ParseRequest(const std::string& line);

// bad_request / busy answers that never reach the pipeline
std::string ErrorResponse(const std::string& kind, const std::string& message,
                          const std::string& request_id = "");

// Read JSON-lines requests from `in` until EOF and answer each on `out`.
// Responses come out in completion order; returns after every answer is written.
// WorkLoop must be running on another thread.
void ServeRequests(std::istream& in, std::ostream& out);

// --once: run a single request synchronously
bool ServeOne(const std::string& request, std::ostream& out);

#endif  // REQUEST_IO_H_
