//! # docsguard Entry Point
//!
//! Delegates to the CLI driver, which parses arguments, sets up logging and
//! runs the selected command.
//!
//! ```bash
//! docsguard check src docs            # Validate links
//! docsguard baseline src docs         # Accept today's findings
//! docsguard scaffold src docs         # Propose and insert links
//! docsguard watch src docs            # Re-check on every change
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return docsguard::cli::docsguard_main(argc, argv);
}
