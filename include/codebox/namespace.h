#ifndef INCLUDE_CODEBOX_NAMESPACE_H_
#define INCLUDE_CODEBOX_NAMESPACE_H_

#include <map>
#include <string>
#include <vector>
#include <unordered_set>

#include "submission.h"

#define ENUM_CAPABILITY_KIND_ \
  X(BUILTIN, "builtin") \
  X(LIBRARY, "library") \
  X(CONSTRUCTOR, "constructor") \
  X(HELPER, "helper") \
  X(VALUE, "value")
enum class CapabilityKind {
#define X(name, desc) name,
  ENUM_CAPABILITY_KIND_
#undef X
};

struct Capability {
  std::string name;
  CapabilityKind kind;
  // LIBRARY & CONSTRUCTOR: "module" or "module:attribute"
  std::string target;
  // LIBRARY: the enumerated surface of the handle; nested members are dotted ("linalg.norm")
  std::vector<std::string> members;
  // LIBRARY: bind an unavailable handle instead of failing if the import fails
  bool optional;
};

extern const char kCapabilityVersion[];
// context bag keys consumed by the helpers; not exposed through `context`
extern const char kInputLocatorKey[];
extern const char kOutputLocatorKey[];

// The fixed capability table. The validator allow-list and every namespace are derived from it.
const std::vector<Capability>& Capabilities();
const Capability* FindCapability(const std::string& name);
const std::unordered_set<std::string>& AllowedNames();

// Constructed fresh per submission; never shared between executions
struct ExecutionContext {
  long id;
  std::vector<Capability> bindings;
  std::map<std::string, std::string> values; // bound as `context`
  std::string input_locator, output_locator;

  ExecutionContext() : id(0) {}
  std::unordered_set<std::string> BoundNames() const;
};

// Throws std::logic_error if the verdict did not accept the submission
ExecutionContext BuildNamespace(const CodeSubmission&, const ValidationVerdict&);

// JSON manifest read by the in-jail prelude
std::string RenderManifest(const ExecutionContext&);

#endif  // INCLUDE_CODEBOX_NAMESPACE_H_
