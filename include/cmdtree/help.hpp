#ifndef CMDTREE_HELP_HPP
#define CMDTREE_HELP_HPP

#include <ostream>
#include <string>
#include <vector>

#include "color.hpp"
#include "context.hpp"

namespace cmdtree {

struct HelpEntry {
    std::string key;  // "show", "<count>", "<eol>"
    std::string text;
    int group{0};
    int order{0};
    bool literal{false};
};

// Help for the children of the context's current node that could be entered next, sorted by
// (group, order) and then declaration order. Help providers are evaluated here, not at build time.
std::vector<HelpEntry> help(const Context& ctx);

// Two-column listing; a blank line separates help groups. `theme` may be null for plain output.
void printHelp(std::ostream& os, const std::vector<HelpEntry>& entries, const ColorTheme* theme = nullptr);

} // namespace cmdtree

#endif // CMDTREE_HELP_HPP
