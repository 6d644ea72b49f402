#ifndef CPUSET_H_
#define CPUSET_H_

#include <sched.h>
#include <string>

// Parses a CPU list such as "0-3,8,10-14:2".
// "all" selects every CPU below ncpu, "none" selects nothing.
bool CpusetParse(const std::string& str, cpu_set_t* set, size_t ncpu);

#endif  // CPUSET_H_
