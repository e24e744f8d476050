#include "cmdtree/help.hpp"

#include <algorithm>

namespace cmdtree {

namespace {

std::string keyFor(const GrammarNode& node) {
    if (node.kind() == NodeKind::Action && !node.consumesToken()) return "<eol>";
    if (node.literal()) return node.name();
    return "<" + node.name() + ">";
}

} // namespace

std::vector<HelpEntry> help(const Context& ctx) {
    std::vector<HelpEntry> out;
    for (const auto child : ctx.currentNode().children()) {
        const auto& node = ctx.grammar().node(child);
        if (node.hidden() || !ctx.canEnter(child)) continue;
        if (node.helpProvider()) {
            for (auto& [key, text] : node.helpProvider()(ctx)) {
                out.push_back({std::move(key), std::move(text), node.helpGroup(), node.helpOrder(), true});
            }
            continue;
        }
        out.push_back({keyFor(node), node.helpText(), node.helpGroup(), node.helpOrder(), node.literal()});
    }
    std::stable_sort(out.begin(), out.end(), [](const HelpEntry& a, const HelpEntry& b) {
        if (a.group != b.group) return a.group < b.group;
        return a.order < b.order;
    });
    return out;
}

void printHelp(std::ostream& os, const std::vector<HelpEntry>& entries, const ColorTheme* theme) {
    std::size_t width = 0;
    for (const auto& e : entries) width = std::max(width, e.key.size());

    auto paint = [&](ColorRole role, const std::string& s) {
        if (theme == nullptr || s.empty()) return s;
        return theme->role(role) + s + theme->reset;
    };

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (i > 0 && entries[i - 1].group != e.group) os << "\n";
        os << "  " << paint(e.literal ? ColorRole::Keyword : ColorRole::Placeholder, e.key);
        if (!e.text.empty()) {
            os << std::string(width - e.key.size() + 2, ' ') << paint(ColorRole::Text, e.text);
        }
        os << "\n";
    }
}

} // namespace cmdtree
