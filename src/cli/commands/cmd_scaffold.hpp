//! # Scaffold Command Interface
//!
//! - `docsguard scaffold [paths...]`: ask about each proposed link
//! - `--force`: accept all
//! - `--dry-run`: show the edits, write nothing

#ifndef DOCSGUARD_CLI_COMMANDS_CMD_SCAFFOLD_HPP
#define DOCSGUARD_CLI_COMMANDS_CMD_SCAFFOLD_HPP

namespace docsguard::cli {

int run_scaffold(int argc, char* argv[]);

} // namespace docsguard::cli

#endif // DOCSGUARD_CLI_COMMANDS_CMD_SCAFFOLD_HPP
