//! # Baseline Command Interface
//!
//! `docsguard baseline [paths...]` records every current finding in the
//! baseline store, so that `check` only blocks on regressions.

#ifndef DOCSGUARD_CLI_COMMANDS_CMD_BASELINE_HPP
#define DOCSGUARD_CLI_COMMANDS_CMD_BASELINE_HPP

namespace docsguard::cli {

int run_baseline(int argc, char* argv[]);

} // namespace docsguard::cli

#endif // DOCSGUARD_CLI_COMMANDS_CMD_BASELINE_HPP
