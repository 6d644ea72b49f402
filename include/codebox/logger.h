#ifndef INCLUDE_CODEBOX_LOGGER_H_
#define INCLUDE_CODEBOX_LOGGER_H_

// Log to stderr and make spdlog's console sinks safe across fork();
// call once before spawning threads and before setting the pattern
void InitLogger();

#endif  // INCLUDE_CODEBOX_LOGGER_H_
