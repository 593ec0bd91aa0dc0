#pragma once

// cmd_generate: mint new ids with the process context (--count, --legacy, --json)
// cmd_fingerprint: print the process fingerprint and counter snapshot
int cmd_generate(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
int cmd_fingerprint(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
