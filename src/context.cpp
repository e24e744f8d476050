#include "cmdtree/context.hpp"

#include <utility>

namespace cmdtree {

std::string_view outcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Terminal: return "terminal";
        case Outcome::Partial: return "partial";
        case Outcome::NoMatch: return "no match";
        case Outcome::ParseError: return "parse error";
    }
    return "partial";
}

Context::Context(const Grammar& grammar, std::string command, std::any* user)
    : grammar_(&grammar),
      command_(std::move(command)),
      user_(user),
      current_(grammar.root()),
      counts_(grammar.size(), 0) {}

std::optional<NodeId> Context::lastNode() const {
    if (history_.empty()) return std::nullopt;
    return history_.back();
}

bool Context::canEnter(NodeId id) const {
    const auto limit = grammar_->node(id).traversals();
    return limit == 0 || counts_.at(id) < limit;
}

void Context::enter(NodeId id, std::size_t cursor) {
    ++counts_.at(id);
    history_.push_back(id);
    current_ = id;
    cursor_ = cursor;
}

} // namespace cmdtree
