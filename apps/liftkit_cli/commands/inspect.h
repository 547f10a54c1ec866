#pragma once

// cmd_to_json: print a LIFT document, or one entry, as JSON.
// Usage: liftkit_cli to-json <file.lift|-> [--entry-id <id>] [--out <path>] [--lenient]
int cmd_to_json(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_languages: list language codes and trait vocabularies used in a LIFT document.
// Usage: liftkit_cli languages <file.lift|-> [--out <path>] [--lenient]
int cmd_languages(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
