//! # Declaration Scanner Tests
//!
//! Rust and TypeScript/JavaScript recognizers, comment attachment, and
//! the failure modes that make a source file unparseable.

#include "code/decl_scanner.hpp"

#include <gtest/gtest.h>

using namespace docsguard;
using namespace docsguard::code;

namespace {

auto scan_ok(std::string_view source, Language lang) -> std::vector<DeclNode> {
    auto result = scan_declarations(source, lang);
    EXPECT_TRUE(is_ok(result));
    if (is_err(result)) {
        return {};
    }
    return unwrap(result);
}

} // namespace

// ============================================================================
// Languages
// ============================================================================

TEST(LanguageTest, ByExtension) {
    EXPECT_EQ(language_for_path("src/lib.rs"), Language::Rust);
    EXPECT_EQ(language_for_path("src/app.ts"), Language::TypeScript);
    EXPECT_EQ(language_for_path("src/View.tsx"), Language::TypeScript);
    EXPECT_EQ(language_for_path("src/index.mjs"), Language::JavaScript);
    EXPECT_EQ(language_for_path("src/index.jsx"), Language::JavaScript);
    EXPECT_FALSE(language_for_path("README.md").has_value());
    EXPECT_FALSE(language_for_path("Makefile").has_value());
}

// ============================================================================
// Rust
// ============================================================================

TEST(RustScannerTest, FunctionWithDocComment) {
    auto decls = scan_ok("/// Logs a user in.\n"
                         "/// @docs: [auth-login]\n"
                         "pub fn login(username: &str, password: &str) -> Result<Session, Error> {\n"
                         "    todo!()\n"
                         "}\n",
                         Language::Rust);
    ASSERT_EQ(decls.size(), 1u);
    EXPECT_EQ(decls[0].name, "login");
    EXPECT_EQ(decls[0].line, 3u);
    ASSERT_EQ(decls[0].params.size(), 2u);
    EXPECT_EQ(decls[0].params[0].name, "username");
    EXPECT_EQ(decls[0].params[0].type, "&str");
    EXPECT_EQ(decls[0].params[1].name, "password");
    ASSERT_EQ(decls[0].comment_lines.size(), 2u);
    EXPECT_EQ(decls[0].comment_lines[1], "/// @docs: [auth-login]");
}

TEST(RustScannerTest, MethodsSkipReceiver) {
    auto decls = scan_ok("impl Service {\n"
                         "    pub fn create(&self, name: String, count: u32) {}\n"
                         "    fn new() -> Self { Self {} }\n"
                         "    fn consume(mut self: Box<Self>) {}\n"
                         "}\n",
                         Language::Rust);
    ASSERT_EQ(decls.size(), 3u);
    EXPECT_EQ(decls[0].name, "create");
    ASSERT_EQ(decls[0].params.size(), 2u);
    EXPECT_EQ(decls[0].params[0].name, "name");
    EXPECT_EQ(decls[0].params[0].type, "String");
    EXPECT_EQ(decls[0].params[1].type, "u32");
    EXPECT_EQ(decls[1].name, "new");
    EXPECT_TRUE(decls[1].params.empty());
    EXPECT_TRUE(decls[2].params.empty());
}

TEST(RustScannerTest, GenericsAndLifetimes) {
    auto decls = scan_ok("pub(crate) async unsafe fn parse<'a, T: Into<String>>(input: &'a str, "
                         "map: HashMap<String, u32>, items: Vec<T>) {}\n",
                         Language::Rust);
    ASSERT_EQ(decls.size(), 1u);
    EXPECT_EQ(decls[0].name, "parse");
    ASSERT_EQ(decls[0].params.size(), 3u);
    EXPECT_EQ(decls[0].params[0].type, "&'a str");
    EXPECT_EQ(decls[0].params[1].name, "map");
    EXPECT_EQ(decls[0].params[1].type, "HashMap<String, u32>");
    EXPECT_EQ(decls[0].params[2].type, "Vec<T>");
}

TEST(RustScannerTest, PatternsAreSkipped) {
    auto decls = scan_ok("fn f(mut buf: Vec<u8>, (a, b): (i32, i32), _: u8) {}\n", Language::Rust);
    ASSERT_EQ(decls.size(), 1u);
    ASSERT_EQ(decls[0].params.size(), 1u);
    EXPECT_EQ(decls[0].params[0].name, "buf");
    EXPECT_EQ(decls[0].params[0].type, "Vec<u8>");
}

TEST(RustScannerTest, FunctionPointerTypeIsNotADeclaration) {
    auto decls = scan_ok("struct S { cb: fn(u8) -> u8 }\n", Language::Rust);
    EXPECT_TRUE(decls.empty());
}

TEST(RustScannerTest, BlankLineDetachesComment) {
    auto decls = scan_ok("/// @docs: [a]\n\nfn a() {}\n", Language::Rust);
    ASSERT_EQ(decls.size(), 1u);
    EXPECT_TRUE(decls[0].comment_lines.empty());
}

TEST(RustScannerTest, AttributesKeepCommentAttached) {
    auto decls = scan_ok("/// @docs: [a]\n"
                         "#[inline]\n"
                         "#[cfg(feature = \"x\")]\n"
                         "fn a() {}\n",
                         Language::Rust);
    ASSERT_EQ(decls.size(), 1u);
    EXPECT_EQ(decls[0].line, 4u);
    ASSERT_EQ(decls[0].comment_lines.size(), 1u);
}

TEST(RustScannerTest, TrailingCommentIsNotLeading) {
    auto decls = scan_ok("let x = 1; // @docs: [b]\nfn b() {}\n", Language::Rust);
    ASSERT_EQ(decls.size(), 1u);
    EXPECT_TRUE(decls[0].comment_lines.empty());
}

TEST(RustScannerTest, StringsAndCommentsAreOpaque) {
    auto decls = scan_ok("const S: &str = r#\"fn fake(x: u8) {\"#;\n"
                         "/* outer /* fn hidden() */ still comment */\n"
                         "fn real(c: char) { let q = '{'; }\n",
                         Language::Rust);
    ASSERT_EQ(decls.size(), 1u);
    EXPECT_EQ(decls[0].name, "real");
    EXPECT_EQ(decls[0].params[0].type, "char");
}

TEST(RustScannerTest, UnclosedParameterListFails) {
    auto result = scan_declarations("fn broken(a: u8\n", Language::Rust);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).line, 1u);
}

TEST(RustScannerTest, UnbalancedBracesFail) {
    EXPECT_TRUE(is_err(scan_declarations("fn a() {\n", Language::Rust)));
    EXPECT_TRUE(is_err(scan_declarations("fn a() {}\n}\n", Language::Rust)));
}

TEST(RustScannerTest, UnterminatedStringFails) {
    EXPECT_TRUE(is_err(scan_declarations("fn a() { \"open }\n", Language::Rust)));
}

// ============================================================================
// TypeScript / JavaScript
// ============================================================================

TEST(TsScannerTest, FunctionDeclaration) {
    auto decls = scan_ok("// @docs: [auth-login]\n"
                         "export async function login(username: string, password?: string): "
                         "Promise<void> {}\n",
                         Language::TypeScript);
    ASSERT_EQ(decls.size(), 1u);
    EXPECT_EQ(decls[0].name, "login");
    EXPECT_EQ(decls[0].line, 2u);
    ASSERT_EQ(decls[0].params.size(), 2u);
    EXPECT_EQ(decls[0].params[0].type, "string");
    EXPECT_EQ(decls[0].params[1].name, "password");
    EXPECT_EQ(decls[0].params[1].type, "string");
    EXPECT_EQ(decls[0].comment_lines.size(), 1u);
}

TEST(TsScannerTest, FunctionValues) {
    auto decls = scan_ok("export const add = (a: number, b: number = 1): number => a + b;\n"
                         "const greet = function (name: string) { return name; };\n"
                         "const twice = x => x * 2;\n"
                         "const notFn = (1 + 2);\n"
                         "let handler: Handler = async (event: Event) => {};\n",
                         Language::TypeScript);
    ASSERT_EQ(decls.size(), 4u);
    EXPECT_EQ(decls[0].name, "add");
    ASSERT_EQ(decls[0].params.size(), 2u);
    EXPECT_EQ(decls[0].params[1].name, "b");
    EXPECT_EQ(decls[0].params[1].type, "number");
    EXPECT_EQ(decls[1].name, "greet");
    EXPECT_EQ(decls[1].params[0].type, "string");
    EXPECT_EQ(decls[2].name, "twice");
    ASSERT_EQ(decls[2].params.size(), 1u);
    EXPECT_FALSE(decls[2].params[0].type.has_value());
    EXPECT_EQ(decls[3].name, "handler");
    EXPECT_EQ(decls[3].params[0].type, "Event");
}

TEST(TsScannerTest, ClassMembers) {
    auto decls = scan_ok("export class AuthService {\n"
                         "  private readonly store: Store;\n"
                         "\n"
                         "  constructor(private db: Database, @Inject(TOKEN) cache: Cache) {}\n"
                         "\n"
                         "  /** @docs: [auth-login] */\n"
                         "  async login(username: string): Promise<Session> {\n"
                         "    if (username) { this.check(username); }\n"
                         "    return this.store.get(username);\n"
                         "  }\n"
                         "\n"
                         "  static get instance(): AuthService { return x; }\n"
                         "\n"
                         "  handle = (e: Event) => {};\n"
                         "}\n",
                         Language::TypeScript);
    ASSERT_EQ(decls.size(), 4u);
    EXPECT_EQ(decls[0].name, "constructor");
    ASSERT_EQ(decls[0].params.size(), 2u);
    EXPECT_EQ(decls[0].params[0].name, "db");
    EXPECT_EQ(decls[0].params[1].name, "cache");
    EXPECT_EQ(decls[0].params[1].type, "Cache");
    EXPECT_EQ(decls[1].name, "login");
    EXPECT_EQ(decls[1].line, 7u);
    EXPECT_EQ(decls[1].comment_lines.size(), 1u);
    EXPECT_EQ(decls[2].name, "instance");
    EXPECT_EQ(decls[3].name, "handle");
}

TEST(TsScannerTest, InterfacesAndCallsAreIgnored) {
    auto decls = scan_ok("interface Repo { find(id: string): User; }\n"
                         "foo(bar, baz);\n"
                         "items.map(function (x) { return x; });\n",
                         Language::TypeScript);
    EXPECT_TRUE(decls.empty());
}

TEST(TsScannerTest, DestructuredAndThisParamsAreSkipped) {
    auto decls =
        scan_ok("function f(this: Window, { a, b }: Opts, [c]: number[], ...rest: string[]) {}\n",
                Language::TypeScript);
    ASSERT_EQ(decls.size(), 1u);
    ASSERT_EQ(decls[0].params.size(), 1u);
    EXPECT_EQ(decls[0].params[0].name, "rest");
    EXPECT_EQ(decls[0].params[0].type, "string[]");
}

TEST(TsScannerTest, LoneApostropheInJsxText) {
    auto decls = scan_ok("const View = () => <p>Don't panic</p>;\n"
                         "function after(x: number) {}\n",
                         Language::TypeScript);
    ASSERT_EQ(decls.size(), 2u);
    EXPECT_EQ(decls[0].name, "View");
    EXPECT_EQ(decls[1].name, "after");
}

TEST(TsScannerTest, TemplateLiteralsAreOpaque) {
    auto decls = scan_ok("const s = `function fake(${x}) {`;\n"
                         "function real(a: string) {}\n",
                         Language::TypeScript);
    ASSERT_EQ(decls.size(), 1u);
    EXPECT_EQ(decls[0].name, "real");
}

TEST(JsScannerTest, UntypedParameters) {
    auto decls = scan_ok("function sum(a, b = 2, { c }) {}\n", Language::JavaScript);
    ASSERT_EQ(decls.size(), 1u);
    ASSERT_EQ(decls[0].params.size(), 2u);
    EXPECT_EQ(decls[0].params[0].name, "a");
    EXPECT_EQ(decls[0].params[1].name, "b");
    EXPECT_FALSE(decls[0].params[1].type.has_value());
}
