#pragma once

// cmd_ranges: print a .lift-ranges file (or one range of it) as JSON.
// Usage: liftkit_cli ranges <file.lift-ranges|-> [--range <id>] [--out <path>]
int cmd_ranges(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_check: report trait, grammatical-info and relation values missing from the ranges.
// Usage: liftkit_cli check <file.lift> --ranges <file.lift-ranges> [--lenient] [--out <path>]
// Exit status is 0 whenever both files parse; warnings are advisory.
int cmd_check(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
