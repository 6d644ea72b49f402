#ifndef CODEBOX_ARTIFACT_STORE_H_
#define CODEBOX_ARTIFACT_STORE_H_

#include <string>
#include <chrono>

// base URL of the artifact store, e.g. http://store:8080 or http://host/api; empty = not configured
extern std::string kArtifactStoreUrl;
// bearer credential; stays on the host
extern std::string kArtifactStoreToken;
// attempts per download; uploads are never retried
extern int kArtifactRetries;
// larger downloads are canceled and reported to the jail as failures
extern long kMaxFetchBytes;

// Client of the artifact store contract:
//   GET  {url}/artifacts/{locator}/{path}
//   POST {url}/artifacts/{locator}/{path}?upload=true
class ArtifactStore {
 public:
  using Deadline = std::chrono::steady_clock::time_point;
 private:
  std::string host_, base_path_, token_;
  int retries_;
  Deadline deadline_;

  std::string Endpoint(const std::string& locator, const std::string& path) const;
  bool PastDeadline() const;
 public:
  ArtifactStore(const std::string& url = kArtifactStoreUrl,
                const std::string& token = kArtifactStoreToken,
                int retries = kArtifactRetries);

  bool Configured() const { return !host_.empty(); }
  // no request runs past this point; retries stop short of it
  void SetDeadline(Deadline deadline) { deadline_ = deadline; }
  // on failure returns false and sets error to a message fit for the submitted code
  bool Fetch(const std::string& locator, const std::string& path,
             std::string& content, std::string& error) const;
  // stored_locator: where the store put it (reply's locator, url or path)
  bool Upload(const std::string& locator, const std::string& path,
              const std::string& content_type, const std::string& content,
              std::string& stored_locator, std::string& error) const;
};

#endif  // CODEBOX_ARTIFACT_STORE_H_
