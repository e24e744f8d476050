#ifndef CMDTREE_PARSER_HPP
#define CMDTREE_PARSER_HPP

#include <any>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "color.hpp"
#include "completion.hpp"
#include "context.hpp"
#include "dispatcher.hpp"
#include "grammar.hpp"
#include "help.hpp"

namespace cmdtree {

// Stateless driver over an immutable Grammar. Every call works on a fresh Context, so one Parser
// (and one Grammar) may serve concurrent callers as long as setOut()/setErr() are not changed
// meanwhile. The Grammar must outlive the Parser.
class Parser {
public:
    struct Options {
        bool withUserObject{false}; // default for actions that do not set it
        bool suggestions{true};     // "Did you mean this?" on unknown tokens
        std::size_t suggestionsMinimumDistance{2};
        ColorMode colorMode{ColorMode::Auto};
        ColorThemeName colorTheme{ColorThemeName::Vscode};
    };

    explicit Parser(const Grammar& grammar) : Parser(grammar, Options{}) {}
    Parser(const Grammar& grammar, Options options) : grammar_(&grammar), options_(options) {}

    Parser& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    Parser& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    [[nodiscard]] const Grammar& grammar() const { return *grammar_; }
    [[nodiscard]] const Options& options() const { return options_; }

    // Matches `text` token by token. Invalid or incomplete input is reported in the Context, never thrown.
    [[nodiscard]] Context parse(std::string_view text, std::any* user = nullptr) const;

    // parse() followed by dispatch(). Dispatch failures are returned in Execution::error;
    // callback exceptions are thrown.
    [[nodiscard]] Execution execute(std::string_view text, std::any* user = nullptr) const;

    // execute() for interactive use: failures are written to the error stream as
    // "Error: <message>" with suggestions. Returns the callback result, or 1 on failure.
    int run(std::string_view text, std::any* user = nullptr) const;

    // Completions for `partial` after the words in `text`.
    [[nodiscard]] std::vector<std::string> complete(std::string_view text, std::string_view partial) const;
    // Completions for a raw input line; the last word is the partial unless the line ends in
    // whitespace outside an open quote.
    [[nodiscard]] std::vector<std::string> completeLine(std::string_view line) const;

    [[nodiscard]] std::vector<HelpEntry> help(std::string_view text) const;
    void printHelp(std::string_view text) const;

private:
    std::ostream& out() const { return out_ ? *out_ : std::cout; }
    std::ostream& err() const { return err_ ? *err_ : std::cerr; }

    // With `finish`, input that ends where an end-of-input Action can be entered enters it.
    Context match(std::string_view text, std::any* user, bool finish) const;
    int fail(const Context& ctx, const std::string& message) const;

    const Grammar* grammar_;
    Options options_;
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
};

} // namespace cmdtree

#endif // CMDTREE_PARSER_HPP
