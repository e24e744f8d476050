#include "cmdtree/completion.hpp"

#include <algorithm>

namespace cmdtree {

namespace {

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::vector<std::string> nodeCandidates(const Context& ctx, NodeId id, std::string_view partial) {
    const auto& node = ctx.grammar().node(id);
    if (node.candidateProvider()) return node.candidateProvider()(ctx, partial);
    if (node.helpProvider()) {
        std::vector<std::string> keys;
        for (auto& entry : node.helpProvider()(ctx)) {
            if (!entry.first.empty() && entry.first[0] != '<') keys.push_back(std::move(entry.first));
        }
        if (!keys.empty()) return keys;
    }
    if (node.kind() == NodeKind::Variable && node.type()) {
        auto fromType = node.type()->candidates(partial);
        if (!fromType.empty()) return fromType;
    }
    if (node.literalChoices()) return *node.literalChoices();
    return {};
}

bool isCandidate(const Context& ctx, NodeId id, std::string_view token) {
    for (auto word : nodeCandidates(ctx, id, token)) {
        while (!word.empty() && word.back() == ' ') word.pop_back();
        if (word == token) return true;
    }
    return false;
}

std::vector<std::string> complete(const Context& ctx, std::string_view partial) {
    std::vector<std::string> out;
    if (ctx.outcome() == Outcome::NoMatch || ctx.outcome() == Outcome::ParseError) return out;

    for (const auto child : ctx.currentNode().children()) {
        const auto& node = ctx.grammar().node(child);
        if (node.hidden() || !ctx.canEnter(child)) continue;
        for (auto& word : nodeCandidates(ctx, child, partial)) {
            if (word.empty() || !startsWith(word, partial)) continue;
            if (word.back() != '/' && word.back() != ' ') word.push_back(' ');
            if (std::find(out.begin(), out.end(), word) == out.end()) out.push_back(std::move(word));
        }
    }
    return out;
}

} // namespace cmdtree
