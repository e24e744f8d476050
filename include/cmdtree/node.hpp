#ifndef CMDTREE_NODE_HPP
#define CMDTREE_NODE_HPP

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "value.hpp"

namespace cmdtree {

class Context;

enum class NodeKind {
    Routing,
    Variable,
    Action,
    Alias,
    Group,
    Root,
};

std::string_view kindName(NodeKind kind);

using HelpPair = std::pair<std::string, std::string>;
// Lazily evaluated help: ordered (key, text) pairs for the current context.
using HelpFunc = std::function<std::vector<HelpPair>(const Context&)>;
// Completion candidates for a partial token. Results are filtered by prefix and suffixed with a separator by the engine.
using CandidatesFunc = std::function<std::vector<std::string>(const Context&, std::string_view partial)>;
using Callback = std::function<int(const Variables& vars)>;
using UserCallback = std::function<int(std::any& user, const Variables& vars)>;

// Attribute overrides a Group applies to the nodes declared beneath it.
struct Overrides {
    std::optional<std::size_t> traversals;
    std::optional<bool> matchCandidates;
    std::optional<int> helpGroup;
    std::optional<int> helpOrder;
    std::optional<bool> hidden;
};

// Declaration of one grammar node and its children. A Node is a value-type builder: it is
// consumed by Grammar, which validates it, resolves aliases and produces the immutable node graph.
//
//   auto root = Node::root();
//   root.add(Node("show", "Show things")
//                .add(Node::variable("count", "How many", types::integer())
//                         .add(Node::action("Show them", show))));
//   Grammar grammar(std::move(root));
class Node {
public:
    // Routing node: matches its own name unless given a pattern.
    explicit Node(std::string name, std::string help = {}) : Node(NodeKind::Routing, std::move(name), std::move(help)) {}

    static Node root() { return Node(NodeKind::Root, {}, {}); }

    static Node variable(std::string name, std::string help, VariableTypePtr type = types::text()) {
        if (!type) throw GrammarDefinitionError("variable " + name + " has no type");
        Node n(NodeKind::Variable, std::move(name), std::move(help));
        n.type_ = std::move(type);
        return n;
    }

    // Action node: matches the end of input unless given a pattern.
    static Node action(std::string help, Callback callback) {
        Node n(NodeKind::Action, {}, std::move(help));
        n.callback_ = std::move(callback);
        return n;
    }

    // Action whose callback receives the user object passed to execute().
    static Node action(std::string help, UserCallback callback) {
        Node n(NodeKind::Action, {}, std::move(help));
        n.userCallback_ = std::move(callback);
        n.withUserObject_ = true;
        return n;
    }

    // Alias for the node(s) at `target`: an absolute path ("/a/b"), a path relative to the
    // alias itself ("../b"), or a glob ("/a/*").
    static Node alias(std::string target) {
        Node n(NodeKind::Alias, {}, {});
        n.target_ = std::move(target);
        return n;
    }

    static Node group(Overrides overrides) {
        Node n(NodeKind::Group, {}, {});
        n.overrides_ = std::move(overrides);
        return n;
    }

    Node& add(Node child);

    template <typename... Nodes>
    Node& add(Node first, Node second, Nodes&&... rest) {
        add(std::move(first));
        return add(std::move(second), std::forward<Nodes>(rest)...);
    }

    Node& name(std::string name);
    Node& pattern(std::string pattern);

    Node& help(std::string text) {
        helpText_ = std::move(text);
        helpFunc_ = nullptr;
        return *this;
    }

    Node& help(HelpFunc provider) {
        helpFunc_ = std::move(provider);
        return *this;
    }

    // Maximum number of entries per parse run; 0 means unlimited. Values other than 1 make a
    // Variable accumulate a sequence.
    Node& traversals(std::size_t limit) {
        traversals_ = limit;
        return *this;
    }

    Node& matchCandidates(bool v = true) {
        matchCandidates_ = v;
        return *this;
    }

    Node& candidates(CandidatesFunc provider) {
        candidates_ = std::move(provider);
        return *this;
    }

    Node& helpGroup(int group) {
        helpGroup_ = group;
        return *this;
    }

    Node& helpOrder(int order) {
        helpOrder_ = order;
        return *this;
    }

    Node& hidden(bool v = true) {
        hidden_ = v;
        return *this;
    }

    // Store a Variable's value under `name` instead of the node name.
    Node& varName(std::string name) {
        varName_ = std::move(name);
        return *this;
    }

    Node& withUserObject(bool v = true) {
        withUserObject_ = v;
        return *this;
    }

    [[nodiscard]] NodeKind kind() const { return kind_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::optional<std::string>& pattern() const { return pattern_; }
    [[nodiscard]] const std::string& helpText() const { return helpText_; }
    [[nodiscard]] const HelpFunc& helpProvider() const { return helpFunc_; }
    [[nodiscard]] const std::optional<std::size_t>& traversals() const { return traversals_; }
    [[nodiscard]] const std::optional<bool>& matchCandidates() const { return matchCandidates_; }
    [[nodiscard]] const CandidatesFunc& candidateProvider() const { return candidates_; }
    [[nodiscard]] const std::optional<int>& helpGroup() const { return helpGroup_; }
    [[nodiscard]] const std::optional<int>& helpOrder() const { return helpOrder_; }
    [[nodiscard]] const std::optional<bool>& hidden() const { return hidden_; }
    [[nodiscard]] const VariableTypePtr& type() const { return type_; }
    [[nodiscard]] const std::string& varName() const { return varName_.empty() ? name_ : varName_; }
    [[nodiscard]] const Callback& callback() const { return callback_; }
    [[nodiscard]] const UserCallback& userCallback() const { return userCallback_; }
    [[nodiscard]] const std::optional<bool>& withUserObject() const { return withUserObject_; }
    [[nodiscard]] const std::string& target() const { return target_; }
    [[nodiscard]] const Overrides& overrides() const { return overrides_; }
    [[nodiscard]] const std::vector<Node>& children() const { return children_; }

private:
    Node(NodeKind kind, std::string name, std::string help)
        : kind_(kind), name_(std::move(name)), helpText_(std::move(help)) {}

    NodeKind kind_;
    std::string name_;
    std::optional<std::string> pattern_;
    std::string helpText_;
    HelpFunc helpFunc_;
    std::optional<std::size_t> traversals_;
    std::optional<bool> matchCandidates_;
    CandidatesFunc candidates_;
    std::optional<int> helpGroup_;
    std::optional<int> helpOrder_;
    std::optional<bool> hidden_;
    VariableTypePtr type_;
    std::string varName_;
    Callback callback_;
    UserCallback userCallback_;
    std::optional<bool> withUserObject_;
    std::string target_;
    Overrides overrides_;
    std::vector<Node> children_;
    std::size_t anonymousChildren_{0};
};

// Candidate provider returning a fixed word list.
inline CandidatesFunc staticCandidates(std::vector<std::string> words) {
    return [words = std::move(words)](const Context&, std::string_view) { return words; };
}

} // namespace cmdtree

#endif // CMDTREE_NODE_HPP
