#include "cmdtree/grammar.hpp"

#include <algorithm>

#include "cmdtree/utils.hpp"

namespace cmdtree {

namespace {

std::vector<std::string> splitPath(std::string_view path) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto pos = path.find('/', start);
        const auto seg = path.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
        if (!seg.empty()) out.emplace_back(seg);
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

// Absolute segments with "." dropped and ".." applied; ".." at the root stays at the root.
std::vector<std::string> normalizePath(std::string_view path) {
    std::vector<std::string> out;
    for (auto& seg : splitPath(path)) {
        if (seg == ".") continue;
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            continue;
        }
        out.push_back(std::move(seg));
    }
    return out;
}

void appendUnique(std::vector<NodeId>& out, NodeId id) {
    if (std::find(out.begin(), out.end(), id) == out.end()) out.push_back(id);
}

} // namespace

bool GrammarNode::matches(std::string_view token) const {
    if (pattern_.empty()) return false;
    return std::regex_match(token.begin(), token.end(), regex_);
}

namespace detail {

struct GrammarBuilder {
    enum class State {
        Unresolved,
        Resolving,
        Resolved,
    };

    std::vector<GrammarNode>& nodes;
    std::vector<State> state{};
    std::vector<std::vector<NodeId>> targets{};

    NodeId make(const Node& decl, std::optional<NodeId> parent, const Overrides* group, std::string name) {
        GrammarNode n;
        n.id_ = nodes.size();
        n.kind_ = decl.kind();
        n.name_ = std::move(name);
        n.parent_ = parent;
        if (!parent) {
            n.path_ = "/";
        } else {
            const auto& parentPath = nodes[*parent].path_;
            n.path_ = (parentPath == "/" ? std::string() : parentPath) + "/" + n.name_;
        }

        const Overrides none{};
        const Overrides& g = group ? *group : none;
        n.traversals_ = decl.traversals().value_or(g.traversals.value_or(1));
        n.matchCandidates_ = decl.matchCandidates().value_or(g.matchCandidates.value_or(false));
        n.helpGroup_ = decl.helpGroup().value_or(g.helpGroup.value_or(n.kind_ == NodeKind::Action ? 9999 : 0));
        n.helpOrder_ = decl.helpOrder().value_or(g.helpOrder.value_or(0));
        n.hidden_ = decl.hidden().value_or(g.hidden.value_or(false));
        n.candidates_ = decl.candidateProvider();
        n.helpText_ = decl.helpText();
        n.helpFunc_ = decl.helpProvider();
        n.type_ = decl.type();
        n.callback_ = decl.callback();
        n.userCallback_ = decl.userCallback();
        n.withUserObject_ = decl.withUserObject();
        n.target_ = decl.target();
        if (n.kind_ == NodeKind::Variable) n.varName_ = decl.varName();

        switch (n.kind_) {
            case NodeKind::Routing: n.pattern_ = decl.pattern().value_or(utils::escapeRegex(n.name_)); break;
            case NodeKind::Variable: n.pattern_ = decl.pattern().value_or(n.type_->pattern()); break;
            case NodeKind::Action: n.pattern_ = decl.pattern().value_or(std::string()); break;
            case NodeKind::Root:
            case NodeKind::Alias:
            case NodeKind::Group: break;
        }
        if (n.pattern_.empty() && (n.kind_ == NodeKind::Routing || n.kind_ == NodeKind::Variable)) {
            throw GrammarDefinitionError("empty pattern for " + n.path_);
        }
        if (!n.pattern_.empty()) {
            try {
                n.regex_ = std::regex(n.pattern_);
            } catch (const std::regex_error& e) {
                throw GrammarDefinitionError("invalid pattern \"" + n.pattern_ + "\" for " + n.path_ + ": " + e.what());
            }
            n.literal_ = (n.pattern_ == utils::escapeRegex(n.name_));
            if (n.literal_) {
                n.choices_ = std::vector<std::string>{n.name_};
            } else {
                n.choices_ = utils::literalChoices(n.pattern_);
            }
        }

        const NodeId id = n.id_;
        nodes.push_back(std::move(n));
        std::size_t anonymous = 0;
        attach(decl, id, group, anonymous);
        return id;
    }

    // Adds `decl`'s children under `parent`, splicing group members in place.
    void attach(const Node& decl, NodeId parent, const Overrides* group, std::size_t& anonymous) {
        for (const auto& child : decl.children()) {
            if (child.kind() == NodeKind::Group) {
                attach(child, parent, &child.overrides(), anonymous);
                continue;
            }
            std::string name = child.name();
            // Node::add reserves '#' for unnamed nodes, so only those are renumbered.
            if (!name.empty() && name[0] == '#') name = "#" + std::to_string(anonymous++);
            for (const auto sibling : nodes[parent].declared_) {
                if (nodes[sibling].name_ == name) {
                    throw GrammarDefinitionError("duplicate child name \"" + name + "\" under " + nodes[parent].path_);
                }
            }
            const NodeId id = make(child, parent, group, std::move(name));
            nodes[parent].declared_.push_back(id);
        }
    }

    // An alias stands for its targets; any other node for itself.
    std::vector<NodeId> expand(NodeId id) {
        if (nodes[id].kind_ != NodeKind::Alias) return {id};
        return resolve(id);
    }

    const std::vector<NodeId>& resolve(NodeId alias) {
        if (state[alias] == State::Resolved) return targets[alias];
        const auto& a = nodes[alias];
        if (state[alias] == State::Resolving) throw AliasResolutionError(a.path_, a.target_, "alias cycle");
        state[alias] = State::Resolving;

        const std::string& target = a.target_;
        if (target.empty()) throw AliasResolutionError(a.path_, target, "empty target path");
        if (target.find("//") != std::string::npos) throw AliasResolutionError(a.path_, target, "malformed path");
        // Relative targets start at the node the alias is attached to.
        const std::string absolute = target[0] == '/' ? target : nodes[*a.parent_].path_ + "/" + target;
        const auto segments = normalizePath(absolute);
        if (segments.empty()) throw AliasResolutionError(a.path_, target, "an alias cannot target the root");

        std::vector<NodeId> current{0};
        for (const auto& seg : segments) {
            if (!utils::isValidGlob(seg)) throw AliasResolutionError(a.path_, target, "malformed glob \"" + seg + "\"");
            const bool glob = utils::hasGlobChars(seg);
            std::vector<NodeId> next;
            for (const auto n : current) {
                const auto declared = nodes[n].declared_;
                for (const auto child : declared) {
                    if (child == alias) continue;
                    if (glob) {
                        for (const auto t : expand(child)) {
                            if (utils::globMatch(seg, nodes[t].name_)) appendUnique(next, t);
                        }
                    } else if (nodes[child].name_ == seg) {
                        for (const auto t : expand(child)) appendUnique(next, t);
                    }
                }
            }
            if (next.empty()) throw AliasResolutionError(nodes[alias].path_, target, "no node matches \"" + seg + "\"");
            current = std::move(next);
        }

        targets[alias] = std::move(current);
        state[alias] = State::Resolved;
        return targets[alias];
    }

    void link() {
        state.assign(nodes.size(), State::Unresolved);
        targets.assign(nodes.size(), {});
        for (NodeId id = 0; id < nodes.size(); ++id) {
            if (nodes[id].kind_ == NodeKind::Alias) resolve(id);
        }
        for (auto& n : nodes) {
            if (n.kind_ == NodeKind::Alias) continue;
            for (const auto d : n.declared_) {
                for (const auto t : expand(d)) appendUnique(n.children_, t);
            }
        }
    }
};

} // namespace detail

Grammar::Grammar(Node root) {
    if (root.kind() != NodeKind::Root) throw GrammarDefinitionError("a grammar must be built from Node::root()");
    detail::GrammarBuilder builder{nodes_};
    builder.make(root, std::nullopt, nullptr, std::string());
    builder.link();
}

std::optional<NodeId> Grammar::find(std::string_view path) const {
    NodeId current = root();
    for (const auto& seg : normalizePath(path)) {
        const auto& children = nodes_[current].children_;
        const auto it = std::find_if(children.begin(), children.end(), [&](NodeId c) { return nodes_[c].name_ == seg; });
        if (it == children.end()) return std::nullopt;
        current = *it;
    }
    return current;
}

std::vector<NodeId> Grammar::findAll(std::string_view pattern) const {
    std::vector<NodeId> current{root()};
    for (const auto& seg : normalizePath(pattern)) {
        if (!utils::isValidGlob(seg)) return {};
        std::vector<NodeId> next;
        for (const auto n : current) {
            for (const auto c : nodes_[n].children_) {
                if (utils::globMatch(seg, nodes_[c].name_)) appendUnique(next, c);
            }
        }
        current = std::move(next);
    }
    return current;
}

std::vector<NodeId> Grammar::walk() const {
    std::vector<NodeId> out;
    std::vector<NodeId> stack{root()};
    while (!stack.empty()) {
        const auto id = stack.back();
        stack.pop_back();
        out.push_back(id);
        const auto& declared = nodes_[id].declared_;
        for (auto it = declared.rbegin(); it != declared.rend(); ++it) {
            if (nodes_[*it].kind_ != NodeKind::Alias) stack.push_back(*it);
        }
    }
    return out;
}

} // namespace cmdtree
