#include <fstream>
#include <sstream>
#include <iostream>
#include <codebox/utils.h>
#include <codebox/result.h>
#include <codebox/validator.h>

static bool as_json = false;

// usage: codebox-lint FILE [json]
// exit status 0 if accepted, 1 if rejected, 2 on usage errors
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << (argc ? argv[0] : "codebox-lint") << " FILE [json]" << std::endl;
    return 2;
  }
  for (int i = 2; i < argc; i++) {
    if (std::string(argv[i]) == "json") as_json = true;
  }
  std::stringstream source;
  {
    std::ifstream fin(argv[1]);
    if (!fin) {
      std::cerr << "cannot open " << argv[1] << std::endl;
      return 2;
    }
    source << fin.rdbuf();
  }

  ValidationVerdict verdict = Validate(source.str());
  if (as_json) {
    std::cout << ResponseToJson(Assemble(verdict)) << std::endl;
  } else if (verdict.accepted) {
    std::cout << "OK" << std::endl;
  } else {
    for (auto& v : verdict.violations) {
      std::cout << argv[1] << ':' << v.line << ": [" << ViolationRuleName(v.rule) << "] "
          << v.message << '\n';
    }
    std::cout << std::flush;
  }
  return verdict.accepted ? 0 : 1;
}
