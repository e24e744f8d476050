#include "cmdtree/schema.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <regex>
#include <set>

namespace cmdtree {

namespace {

std::string_view trimWs(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n' || s.front() == '\r')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

bool tryParseBool(std::string_view s, bool& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    if (t == "1" || t == "true" || t == "True" || t == "TRUE" || t == "on" || t == "yes") {
        out = true;
        return true;
    }
    if (t == "0" || t == "false" || t == "False" || t == "FALSE" || t == "off" || t == "no") {
        out = false;
        return true;
    }
    return false;
}

bool tryParseInt(std::string_view s, int& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(v);
    return true;
}

enum class Variant {
    Root,
    Routing,
    Variable,
    Action,
    Alias,
    Group,
};

Variant parseVariant(const std::string& tag) {
    if (tag == "root") return Variant::Root;
    if (tag == "node") return Variant::Routing;
    if (tag == "variable") return Variant::Variable;
    if (tag == "action") return Variant::Action;
    if (tag == "alias") return Variant::Alias;
    if (tag == "group") return Variant::Group;
    throw SchemaError("unknown node variant \"" + tag + "\"");
}

const std::set<std::string>& allowedAttributes(Variant v) {
    static const std::set<std::string> root{};
    static const std::set<std::string> routing{
        "name", "pattern", "help", "help_provider", "traversals", "match_candidates", "candidates", "group", "order", "hidden"};
    static const std::set<std::string> variable = [] {
        auto s = routing;
        s.insert({"type", "var_name"});
        return s;
    }();
    static const std::set<std::string> action{
        "help", "help_provider", "pattern", "traversals", "callback", "with_user_object", "group", "order", "hidden"};
    static const std::set<std::string> alias{"target"};
    static const std::set<std::string> group{"traversals", "match_candidates", "group", "order", "hidden"};
    switch (v) {
        case Variant::Root: return root;
        case Variant::Routing: return routing;
        case Variant::Variable: return variable;
        case Variant::Action: return action;
        case Variant::Alias: return alias;
        case Variant::Group: return group;
    }
    return root;
}

// Typed view over one description's attributes; every accessor validates its value.
class Attributes {
public:
    Attributes(const NodeDescription& d, Variant v) : d_(d) {
        const auto& allowed = allowedAttributes(v);
        for (const auto& [key, value] : d.attributes) {
            (void)value;
            if (allowed.count(key) == 0) {
                throw SchemaError("attribute \"" + key + "\" is not valid for <" + d.variant + ">");
            }
        }
    }

    [[nodiscard]] const std::string* raw(const std::string& key) const {
        const auto it = d_.attributes.find(key);
        return it == d_.attributes.end() ? nullptr : &it->second;
    }

    [[nodiscard]] std::string required(const std::string& key) const {
        const auto* v = raw(key);
        if (v == nullptr || v->empty()) throw SchemaError("<" + d_.variant + "> requires attribute \"" + key + "\"");
        return *v;
    }

    [[nodiscard]] std::string string(const std::string& key) const {
        const auto* v = raw(key);
        return v ? *v : std::string();
    }

    [[nodiscard]] std::optional<int> integer(const std::string& key) const {
        const auto* v = raw(key);
        if (v == nullptr) return std::nullopt;
        int out = 0;
        if (!tryParseInt(*v, out)) throw invalid(key, *v, "an integer");
        return out;
    }

    [[nodiscard]] std::optional<std::size_t> count(const std::string& key) const {
        const auto v = integer(key);
        if (!v) return std::nullopt;
        if (*v < 0) throw invalid(key, *raw(key), "a non-negative integer");
        return static_cast<std::size_t>(*v);
    }

    [[nodiscard]] std::optional<bool> boolean(const std::string& key) const {
        const auto* v = raw(key);
        if (v == nullptr) return std::nullopt;
        bool out = false;
        if (!tryParseBool(*v, out)) throw invalid(key, *v, "a boolean");
        return out;
    }

    [[nodiscard]] std::optional<std::string> regex(const std::string& key) const {
        const auto* v = raw(key);
        if (v == nullptr) return std::nullopt;
        try {
            std::regex re(*v);
            (void)re;
        } catch (const std::regex_error&) {
            throw invalid(key, *v, "a regular expression");
        }
        return *v;
    }

    template <typename T>
    const T* named(const std::string& key, const T* found) const {
        if (found == nullptr) throw SchemaError("unknown " + key + " \"" + *raw(key) + "\"");
        return found;
    }

private:
    SchemaError invalid(const std::string& key, const std::string& value, const std::string& expected) const {
        return SchemaError("attribute \"" + key + "\" of <" + d_.variant + ">: \"" + value + "\" is not " + expected);
    }

    const NodeDescription& d_;
};

void applyCommon(Node& node, const Attributes& a, const Registry& registry) {
    if (auto v = a.regex("pattern")) node.pattern(std::move(*v));
    if (a.raw("help")) node.help(a.string("help"));
    if (const auto* name = a.raw("help_provider")) node.help(*a.named("help_provider", registry.findHelpProvider(*name)));
    if (auto v = a.count("traversals")) node.traversals(*v);
    if (auto v = a.boolean("match_candidates")) node.matchCandidates(*v);
    if (const auto* name = a.raw("candidates")) node.candidates(*a.named("candidates", registry.findCandidates(*name)));
    if (auto v = a.integer("group")) node.helpGroup(*v);
    if (auto v = a.integer("order")) node.helpOrder(*v);
    if (auto v = a.boolean("hidden")) node.hidden(*v);
}

Node makeAction(const Attributes& a, const Registry& registry) {
    const auto* name = a.raw("callback");
    if (name == nullptr) return Node::action(a.string("help"), Callback{});
    if (const auto* cb = registry.findCallback(*name)) return Node::action(a.string("help"), *cb);
    if (const auto* cb = registry.findUserCallback(*name)) return Node::action(a.string("help"), *cb);
    throw SchemaError("unknown callback \"" + *name + "\"");
}

} // namespace

VariableTypePtr Registry::findType(const std::string& name) const {
    if (const auto* t = lookup(types_, name)) return *t;
    return types::byName(name);
}

Node buildNode(const NodeDescription& description, const Registry& registry) {
    const Variant variant = parseVariant(description.variant);
    const Attributes a(description, variant);

    Node node = [&] {
        switch (variant) {
            case Variant::Root: return Node::root();
            case Variant::Routing: return Node(a.required("name"));
            case Variant::Variable: {
                VariableTypePtr type = types::text();
                if (const auto* name = a.raw("type")) {
                    type = registry.findType(*name);
                    if (!type) throw SchemaError("unknown type \"" + *name + "\"");
                }
                return Node::variable(a.required("name"), {}, std::move(type));
            }
            case Variant::Action: return makeAction(a, registry);
            case Variant::Alias: return Node::alias(a.required("target"));
            case Variant::Group: {
                Overrides o;
                o.traversals = a.count("traversals");
                o.matchCandidates = a.boolean("match_candidates");
                o.helpGroup = a.integer("group");
                o.helpOrder = a.integer("order");
                o.hidden = a.boolean("hidden");
                return Node::group(o);
            }
        }
        return Node::root();
    }();

    if (variant == Variant::Routing || variant == Variant::Variable || variant == Variant::Action) {
        applyCommon(node, a, registry);
    }
    if (variant == Variant::Variable && a.raw("var_name")) node.varName(a.string("var_name"));
    if (variant == Variant::Action) {
        if (auto v = a.boolean("with_user_object")) node.withUserObject(*v);
    }

    for (const auto& child : description.children) node.add(buildNode(child, registry));
    return node;
}

Grammar buildGrammar(const NodeDescription& root, const Registry& registry) {
    if (root.variant != "root") throw SchemaError("a grammar description must start with <root>, not <" + root.variant + ">");
    return Grammar(buildNode(root, registry));
}

} // namespace cmdtree
