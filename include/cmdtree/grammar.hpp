#ifndef CMDTREE_GRAMMAR_HPP
#define CMDTREE_GRAMMAR_HPP

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "node.hpp"

namespace cmdtree {

using NodeId = std::size_t;

namespace detail {
struct GrammarBuilder;
} // namespace detail

// A node of a built Grammar, with every attribute resolved
// (explicit setting > enclosing group override > kind default).
class GrammarNode {
public:
    [[nodiscard]] NodeId id() const { return id_; }
    [[nodiscard]] NodeKind kind() const { return kind_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::optional<NodeId>& parent() const { return parent_; }
    // Outgoing edges in tie-break order: owned children plus alias targets at the alias's position.
    [[nodiscard]] const std::vector<NodeId>& children() const { return children_; }

    [[nodiscard]] const std::string& pattern() const { return pattern_; }
    // False for the root and for actions that match the end of input.
    [[nodiscard]] bool consumesToken() const { return !pattern_.empty(); }
    [[nodiscard]] bool matches(std::string_view token) const;
    // True when the pattern is the escaped node name.
    [[nodiscard]] bool literal() const { return literal_; }
    // Finite word set the pattern denotes, if any (the name itself for literal nodes).
    [[nodiscard]] const std::optional<std::vector<std::string>>& literalChoices() const { return choices_; }

    [[nodiscard]] std::size_t traversals() const { return traversals_; }
    // Variables store a sequence whenever more than one entry is structurally possible.
    [[nodiscard]] bool accumulates() const { return traversals_ != 1; }
    [[nodiscard]] bool matchCandidates() const { return matchCandidates_; }
    [[nodiscard]] const CandidatesFunc& candidateProvider() const { return candidates_; }
    [[nodiscard]] const std::string& helpText() const { return helpText_; }
    [[nodiscard]] const HelpFunc& helpProvider() const { return helpFunc_; }
    [[nodiscard]] int helpGroup() const { return helpGroup_; }
    [[nodiscard]] int helpOrder() const { return helpOrder_; }
    [[nodiscard]] bool hidden() const { return hidden_; }

    [[nodiscard]] const VariableTypePtr& type() const { return type_; }
    [[nodiscard]] const std::string& varName() const { return varName_; }

    [[nodiscard]] const Callback& callback() const { return callback_; }
    [[nodiscard]] const UserCallback& userCallback() const { return userCallback_; }
    [[nodiscard]] const std::optional<bool>& withUserObject() const { return withUserObject_; }

    [[nodiscard]] const std::string& target() const { return target_; }

private:
    friend class Grammar;
    friend struct detail::GrammarBuilder;

    NodeId id_{0};
    NodeKind kind_{NodeKind::Routing};
    std::string name_;
    std::string path_;
    std::optional<NodeId> parent_;
    std::vector<NodeId> declared_;
    std::vector<NodeId> children_;
    std::string pattern_;
    std::regex regex_;
    bool literal_{false};
    std::optional<std::vector<std::string>> choices_;
    std::size_t traversals_{1};
    bool matchCandidates_{false};
    CandidatesFunc candidates_;
    std::string helpText_;
    HelpFunc helpFunc_;
    int helpGroup_{0};
    int helpOrder_{0};
    bool hidden_{false};
    VariableTypePtr type_;
    std::string varName_;
    Callback callback_;
    UserCallback userCallback_;
    std::optional<bool> withUserObject_;
    std::string target_;
};

// Immutable, fully resolved grammar. Construction validates the declaration, applies group
// overrides, resolves every alias and throws GrammarDefinitionError or AliasResolutionError on
// failure; a Grammar object never exists in a partially built state. A built Grammar may be
// shared read-only by any number of concurrent parses.
class Grammar {
public:
    explicit Grammar(Node root);

    [[nodiscard]] NodeId root() const { return 0; }
    [[nodiscard]] const GrammarNode& node(NodeId id) const { return nodes_.at(id); }
    [[nodiscard]] std::size_t size() const { return nodes_.size(); }

    // Node at an absolute path, following alias edges. Globs are not expanded.
    [[nodiscard]] std::optional<NodeId> find(std::string_view path) const;
    // Nodes matching an absolute path whose segments may be globs.
    [[nodiscard]] std::vector<NodeId> findAll(std::string_view pattern) const;
    // Every reachable owned node in declaration order, root first. Alias declarations are not nodes.
    [[nodiscard]] std::vector<NodeId> walk() const;
    [[nodiscard]] const std::string& path(NodeId id) const { return node(id).path(); }

private:
    std::vector<GrammarNode> nodes_;
};

} // namespace cmdtree

#endif // CMDTREE_GRAMMAR_HPP
