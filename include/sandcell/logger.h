#ifndef INCLUDE_SANDCELL_LOGGER_H_
#define INCLUDE_SANDCELL_LOGGER_H_

// 0: warn, 1: info, 2+: debug
int VerbosityToLevel(int verbosity);

// Sets up the default logger; must be called before any thread forks a sandbox child
void InitLogger(int verbosity);

#endif  // INCLUDE_SANDCELL_LOGGER_H_
