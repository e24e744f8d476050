#ifndef CMDTREE_SCHEMA_HPP
#define CMDTREE_SCHEMA_HPP

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "grammar.hpp"
#include "node.hpp"

namespace cmdtree {

// Loader-facing form of a node: what an XML or other declarative grammar file decodes to.
//
// Variants and the attributes each accepts:
//   root
//   node      name* pattern help help_provider traversals match_candidates candidates group order hidden
//   variable  name* type var_name, plus everything "node" accepts
//   action    help help_provider pattern traversals callback with_user_object group order hidden
//   alias     target*
//   group     traversals match_candidates group order hidden
// (* required). Attribute values are strings and are parsed by a fixed per-attribute parser.
struct NodeDescription {
    std::string variant;
    std::map<std::string, std::string> attributes;
    std::vector<NodeDescription> children;
};

// Named objects a description may refer to (callback="show", type="integer", ...).
class Registry {
public:
    Registry& callback(std::string name, Callback cb) {
        callbacks_[std::move(name)] = std::move(cb);
        return *this;
    }

    Registry& userCallback(std::string name, UserCallback cb) {
        userCallbacks_[std::move(name)] = std::move(cb);
        return *this;
    }

    Registry& candidates(std::string name, CandidatesFunc provider) {
        candidates_[std::move(name)] = std::move(provider);
        return *this;
    }

    Registry& helpProvider(std::string name, HelpFunc provider) {
        helpProviders_[std::move(name)] = std::move(provider);
        return *this;
    }

    // Registered types shadow the built-in ones of the same name.
    Registry& type(std::string name, VariableTypePtr type) {
        types_[std::move(name)] = std::move(type);
        return *this;
    }

    [[nodiscard]] const Callback* findCallback(const std::string& name) const { return lookup(callbacks_, name); }
    [[nodiscard]] const UserCallback* findUserCallback(const std::string& name) const { return lookup(userCallbacks_, name); }
    [[nodiscard]] const CandidatesFunc* findCandidates(const std::string& name) const { return lookup(candidates_, name); }
    [[nodiscard]] const HelpFunc* findHelpProvider(const std::string& name) const { return lookup(helpProviders_, name); }
    // Registered type, else a built-in type (types::byName), else null.
    [[nodiscard]] VariableTypePtr findType(const std::string& name) const;

private:
    template <typename Map>
    static const typename Map::mapped_type* lookup(const Map& m, const std::string& name) {
        const auto it = m.find(name);
        return it == m.end() ? nullptr : &it->second;
    }

    std::unordered_map<std::string, Callback> callbacks_;
    std::unordered_map<std::string, UserCallback> userCallbacks_;
    std::unordered_map<std::string, CandidatesFunc> candidates_;
    std::unordered_map<std::string, HelpFunc> helpProviders_;
    std::unordered_map<std::string, VariableTypePtr> types_;
};

// Builds the declaration for `description` and its children. Throws SchemaError for an unknown
// variant, an attribute outside the variant's schema, a missing required attribute, a value its
// parser rejects, or an unknown named reference; GrammarDefinitionError propagates from Node.
Node buildNode(const NodeDescription& description, const Registry& registry);

// buildNode() on a "root" description, then Grammar construction.
Grammar buildGrammar(const NodeDescription& root, const Registry& registry);

} // namespace cmdtree

#endif // CMDTREE_SCHEMA_HPP
