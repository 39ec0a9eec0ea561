#pragma once

namespace stratlab {
namespace cli {

// stratlab --spec <spec.json> --prices <prices.csv|prices.json>
//          [--config <config.json>] [--log-dir <dir>] [--json] [--series]
// Returns the process exit code: 0 ok, 1 errors, 2 usage.
// With --json, stdout carries only the JSON document; logs and notices go to stderr.
int run(int argc, char* argv[]);

} // namespace cli
} // namespace stratlab
