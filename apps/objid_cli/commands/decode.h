#pragma once

// cmd_inspect: decode <hex> (--legacy for legacy input) and print its fields
// cmd_convert: decode <hex> (--from) and print it in another form (--to)
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_convert(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
