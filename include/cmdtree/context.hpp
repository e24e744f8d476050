#ifndef CMDTREE_CONTEXT_HPP
#define CMDTREE_CONTEXT_HPP

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "grammar.hpp"
#include "value.hpp"

namespace cmdtree {

enum class Outcome {
    Terminal,   // all input consumed, stopped at an Action
    Partial,    // all input consumed, no Action reachable without more input
    NoMatch,    // a token matched no eligible child
    ParseError, // a Variable's parse hook rejected its token
};

std::string_view outcomeName(Outcome outcome);

// State of one parse run. Created and mutated by Parser::parse(), read-only afterwards.
class Context {
public:
    Context(const Grammar& grammar, std::string command, std::any* user = nullptr);

    [[nodiscard]] const Grammar& grammar() const { return *grammar_; }
    [[nodiscard]] const std::string& command() const { return command_; }
    [[nodiscard]] std::any* user() const { return user_; }

    // Character offset splitting the input into parsed() and remaining().
    [[nodiscard]] std::size_t cursor() const { return cursor_; }
    [[nodiscard]] std::string_view parsed() const { return std::string_view(command_).substr(0, cursor_); }
    [[nodiscard]] std::string_view remaining() const { return std::string_view(command_).substr(cursor_); }

    [[nodiscard]] NodeId current() const { return current_; }
    [[nodiscard]] const GrammarNode& currentNode() const { return grammar_->node(current_); }
    // Last node entered, if any. The root is never entered.
    [[nodiscard]] std::optional<NodeId> lastNode() const;

    [[nodiscard]] const Variables& vars() const { return vars_; }
    [[nodiscard]] std::size_t traversed(NodeId id) const { return counts_.at(id); }
    [[nodiscard]] bool canEnter(NodeId id) const;
    [[nodiscard]] const std::vector<NodeId>& history() const { return history_; }

    [[nodiscard]] Outcome outcome() const { return outcome_; }
    [[nodiscard]] bool terminal() const { return outcome_ == Outcome::Terminal; }
    [[nodiscard]] const std::optional<VariableParseError>& error() const { return error_; }

private:
    friend class Parser;

    void enter(NodeId id, std::size_t cursor);

    const Grammar* grammar_;
    std::string command_;
    std::any* user_;
    std::size_t cursor_{0};
    NodeId current_;
    Variables vars_;
    std::vector<std::size_t> counts_;
    std::vector<NodeId> history_;
    Outcome outcome_{Outcome::Partial};
    std::optional<VariableParseError> error_;
};

} // namespace cmdtree

#endif // CMDTREE_CONTEXT_HPP
