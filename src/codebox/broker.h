#ifndef CODEBOX_BROKER_H_
#define CODEBOX_BROKER_H_

#include <string>
#include <vector>
#include <optional>

#include <codebox/namespace.h>
#include <codebox/submission.h>
#include "artifact_store.h"

// uploads accepted per execution
extern long kMaxArtifacts;
// longest request line accepted from a jail; longer ones close the channel
extern long kMaxRequestBytes;

// what the prelude reported before exiting
struct FinishReport {
  std::string status; // ok, error, memory or setup
  std::string summary; // ok: trailing expression value
  std::string type, message; // error: exception; setup: message
  int line; // error: 0 if unknown

  FinishReport() : line(0) {}
};

// Host side of the I/O helpers. One instance per execution; it is the only
// place where locators and the store credential meet the jail's requests.
class HelperBroker {
  const ArtifactStore& store_;
  const ExecutionContext& ctx_;
  std::vector<ArtifactDescriptor> artifacts_;
  std::optional<FinishReport> finish_;
  long requests_;

  std::string HandleFetch(const std::string& path);
  std::string HandleUpload(const std::string& path, const std::string& kind,
                           const std::string& content_type, const std::string& content);
 public:
  HelperBroker(const ArtifactStore& store, const ExecutionContext& ctx) :
      store_(store), ctx_(ctx), requests_(0) {}

  // One JSON request line in, one JSON reply line out (without the newline).
  // finish messages produce no reply (empty string).
  std::string Handle(const std::string& line);

  const std::vector<ArtifactDescriptor>& Artifacts() const { return artifacts_; }
  const std::optional<FinishReport>& Finish() const { return finish_; }
  long Requests() const { return requests_; }
};

#endif  // CODEBOX_BROKER_H_
