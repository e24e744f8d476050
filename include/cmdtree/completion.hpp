#ifndef CMDTREE_COMPLETION_HPP
#define CMDTREE_COMPLETION_HPP

#include <string>
#include <string_view>
#include <vector>

#include "context.hpp"

namespace cmdtree {

// Words node `id` offers for `partial`, unfiltered and without separators: the node's candidate
// provider, else the keys of its help provider that are not "<placeholders>", else its variable
// type's candidates, else the literal words its pattern denotes.
std::vector<std::string> nodeCandidates(const Context& ctx, NodeId id, std::string_view partial);

// True if `token` equals one of the words node `id` offers.
bool isCandidate(const Context& ctx, NodeId id, std::string_view token);

// Completions for `partial` below the context's current node, in declared child order. Each
// candidate carries a trailing separator (" "), except directory-like entries ending in '/'.
// Hidden children and children whose traversal limit is reached offer nothing.
std::vector<std::string> complete(const Context& ctx, std::string_view partial);

} // namespace cmdtree

#endif // CMDTREE_COMPLETION_HPP
