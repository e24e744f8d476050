#include "cmdtree/node.hpp"

#include <regex>

namespace cmdtree {

std::string_view kindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Routing: return "node";
        case NodeKind::Variable: return "variable";
        case NodeKind::Action: return "action";
        case NodeKind::Alias: return "alias";
        case NodeKind::Group: return "group";
        case NodeKind::Root: return "root";
    }
    return "node";
}

Node& Node::add(Node child) {
    if (kind_ == NodeKind::Action || kind_ == NodeKind::Alias) {
        throw GrammarDefinitionError(std::string(kindName(kind_)) + " nodes cannot have children");
    }
    if (child.kind_ == NodeKind::Root) throw GrammarDefinitionError("a root node cannot be attached as a child");

    if (child.name_.empty()) {
        if (child.kind_ == NodeKind::Routing || child.kind_ == NodeKind::Variable) {
            throw GrammarDefinitionError(std::string(kindName(child.kind_)) + " nodes must be named");
        }
        child.name_ = "#" + std::to_string(anonymousChildren_++);
    } else if (child.name_[0] == '#') {
        throw GrammarDefinitionError("name \"" + child.name_ + "\" is reserved: names starting with '#' denote unnamed nodes");
    }

    // Group children are checked once flattened into their parent, at grammar build.
    for (const auto& existing : children_) {
        if (existing.name_ == child.name_) {
            throw GrammarDefinitionError("duplicate child name \"" + child.name_ + "\" under \"" + name_ + "\"");
        }
    }

    children_.push_back(std::move(child));
    return *this;
}

Node& Node::name(std::string name) {
    if (kind_ == NodeKind::Root) throw GrammarDefinitionError("the root node has no name");
    name_ = std::move(name);
    return *this;
}

Node& Node::pattern(std::string pattern) {
    if (kind_ == NodeKind::Root || kind_ == NodeKind::Alias || kind_ == NodeKind::Group) {
        throw GrammarDefinitionError(std::string(kindName(kind_)) + " nodes do not match input");
    }
    try {
        std::regex re(pattern);
        (void)re;
    } catch (const std::regex_error& e) {
        throw GrammarDefinitionError("invalid pattern \"" + pattern + "\" for \"" + name_ + "\": " + e.what());
    }
    pattern_ = std::move(pattern);
    return *this;
}

} // namespace cmdtree
