#include "cpuset.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace {

// parse a decimal number at str[pos]; advances pos
bool NextNumber(const std::string& str, size_t& pos, unsigned long& result) {
  if (pos >= str.size() || !isdigit((unsigned char)str[pos])) return false;
  const char* begin = str.c_str() + pos;
  char* end = nullptr;
  errno = 0;
  result = strtoul(begin, &end, 10);
  if (errno || end == begin) return false;
  pos += end - begin;
  return true;
}

} // namespace

bool CpusetParse(const std::string& str, cpu_set_t* set, size_t ncpu) {
  CPU_ZERO(set);
  if (str == "all") {
    for (size_t i = 0; i < ncpu; i++) CPU_SET(i, set);
    return true;
  }
  if (str == "none") return true;

  size_t pos = 0;
  while (true) {
    unsigned long a, b, stride = 1;
    if (!NextNumber(str, pos, a)) return false;
    b = a;
    if (pos < str.size() && str[pos] == '-') {
      pos++;
      if (!NextNumber(str, pos, b)) return false;
      if (pos < str.size() && str[pos] == ':') {
        pos++;
        if (!NextNumber(str, pos, stride) || stride == 0) return false;
      }
    }
    if (a > b) return false;
    for (; a <= b && a < ncpu; a += stride) CPU_SET(a, set);
    if (pos == str.size()) break;
    if (str[pos] != ',') return false;
    pos++;
  }
  return true;
}
