//! # docsguard Driver Interface
//!
//! `docsguard_main()` dispatches to the command handler named by argv[1].

#ifndef DOCSGUARD_CLI_DRIVER_HPP
#define DOCSGUARD_CLI_DRIVER_HPP

namespace docsguard::cli {

/// Returns the process exit code: 0 pass, 1 blocking findings, 2 fatal.
int docsguard_main(int argc, char* argv[]);

} // namespace docsguard::cli

#endif // DOCSGUARD_CLI_DRIVER_HPP
