#pragma once

// cmd_normalize: parse a LIFT file and write it back in canonical form.
// Usage: liftkit_cli normalize <file.lift|-> [--out <path>] [--lenient]
//                              [--known-subset] [--prefixed] [--producer <name>]
int cmd_normalize(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
