#ifndef CONFIG_H_
#define CONFIG_H_

#include <coderun/paths.h>

extern const char kDefaultConfig[];

// Load the global section of an INI file into the k-globals.
// Keys that are absent keep their current value. Returns false if the file cannot be read.
bool ParseConfig(const fs::path& conf_path);

// Log every invalid value; false if any
bool CheckConfig();

// Command line, then the config file it names (or kDefaultConfig if that exists),
// then command line overrides. Returns false on any error; never exits.
bool ParseArgs(int argc, char** argv, int& verbosity);

#endif  // CONFIG_H_
