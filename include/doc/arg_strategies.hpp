//! # Argument Extraction Strategies
//!
//! The closed set of documentation-argument shapes. Strategies are tried in
//! `STRATEGY_ORDER`; each one scans the section body in block order and the
//! first non-empty extraction wins. Table goes first because it is the most
//! explicit shape: a body that also satisfies List resolves as Table.
//!
//! ## Recognized Shapes
//!
//! ```markdown
//! | Param    | Type   | Description      |     <- Table
//! |----------|--------|------------------|
//! | username | string | Account name     |
//!
//! - `username` (`string`): Account name        <- List
//! - password: string: Secret
//!
//! `username` (string) - Account name           <- Definition
//! password: Secret
//! ```

#ifndef DOCSGUARD_DOC_ARG_STRATEGIES_HPP
#define DOCSGUARD_DOC_ARG_STRATEGIES_HPP

#include "doc/markdown_lexer.hpp"
#include "model/entity.hpp"

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace docsguard::doc {

enum class ArgStrategy { Table, List, Definition };

inline constexpr std::array<ArgStrategy, 3> STRATEGY_ORDER = {
    ArgStrategy::Table,
    ArgStrategy::List,
    ArgStrategy::Definition,
};

[[nodiscard]] auto strategy_name(ArgStrategy strategy) -> const char*;

/// Attempts one strategy on one block. Returns an empty list when the block
/// does not have the strategy's shape.
[[nodiscard]] auto try_extract(ArgStrategy strategy, const Block& block)
    -> std::vector<model::Arg>;

/// Result of running the strategies over a section body.
struct ArgExtraction {
    std::optional<ArgStrategy> strategy; ///< Winning strategy, if any
    std::vector<model::Arg> args;
};

/// Runs every strategy in priority order over the body blocks.
[[nodiscard]] auto extract_args(std::span<const Block> body) -> ArgExtraction;

/// Parses one `term [type] delimiter description` entry, as used by list
/// items and definition lines. With `require_delimiter` unset, a backticked
/// term or a typed term may stand alone.
[[nodiscard]] auto parse_term_entry(std::string_view text, bool require_delimiter)
    -> std::optional<model::Arg>;

} // namespace docsguard::doc

#endif // DOCSGUARD_DOC_ARG_STRATEGIES_HPP
