//! # Watch Command Interface
//!
//! `docsguard watch [paths...]` polls the inputs and re-runs `check` when
//! one of them changes. Runs until interrupted.

#ifndef DOCSGUARD_CLI_COMMANDS_CMD_WATCH_HPP
#define DOCSGUARD_CLI_COMMANDS_CMD_WATCH_HPP

namespace docsguard::cli {

int run_watch(int argc, char* argv[]);

} // namespace docsguard::cli

#endif // DOCSGUARD_CLI_COMMANDS_CMD_WATCH_HPP
