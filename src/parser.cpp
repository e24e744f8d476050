#include "cmdtree/parser.hpp"

#include <utility>

#include "cmdtree/utils.hpp"

namespace cmdtree {

namespace {

std::optional<NodeId> endOfInputAction(const Context& ctx) {
    for (const auto child : ctx.currentNode().children()) {
        const auto& node = ctx.grammar().node(child);
        if (node.kind() == NodeKind::Action && !node.consumesToken() && ctx.canEnter(child)) return child;
    }
    return std::nullopt;
}

} // namespace

Context Parser::match(std::string_view text, std::any* user, bool finish) const {
    Context ctx(*grammar_, std::string(text), user);
    const auto tokens = utils::tokenize(text);
    std::size_t next = 0;

    for (;;) {
        const auto& current = ctx.currentNode();
        if (next == tokens.size()) {
            ctx.outcome_ = Outcome::Partial;
            if (current.kind() == NodeKind::Action) {
                ctx.outcome_ = Outcome::Terminal;
            } else if (finish) {
                if (const auto eol = endOfInputAction(ctx)) {
                    ctx.enter(*eol, text.size());
                    ctx.outcome_ = Outcome::Terminal;
                }
            }
            break;
        }

        const auto& token = tokens[next];
        std::optional<NodeId> chosen;
        for (const auto child : current.children()) {
            if (!ctx.canEnter(child)) continue;
            const auto& node = grammar_->node(child);
            if (!node.matches(token.text)) continue;
            if (node.matchCandidates() && !isCandidate(ctx, child, token.text)) continue;
            chosen = child;
            break;
        }
        if (!chosen) {
            ctx.outcome_ = Outcome::NoMatch;
            break;
        }

        const auto& node = grammar_->node(*chosen);
        if (node.kind() == NodeKind::Variable) {
            VarValue value;
            if (auto error = node.type()->parse(token.text, value)) {
                ctx.error_ = VariableParseError{node.path(), token.text, std::move(*error)};
                ctx.outcome_ = Outcome::ParseError;
                break;
            }
            ctx.vars_.store(node.varName(), std::move(value), node.accumulates());
        }
        ++next;
        ctx.enter(*chosen, next < tokens.size() ? tokens[next].begin : text.size());
    }
    return ctx;
}

Context Parser::parse(std::string_view text, std::any* user) const { return match(text, user, true); }

Execution Parser::execute(std::string_view text, std::any* user) const {
    Execution exec{parse(text, user), std::nullopt, std::nullopt, std::nullopt};
    if (!exec.context.terminal()) {
        exec.incomplete = IncompleteCommandError(std::string(exec.context.parsed()),
                                                 std::string(exec.context.remaining()),
                                                 describeFailure(exec.context));
        exec.error = *exec.incomplete;
        return exec;
    }
    try {
        checkDispatch(exec.context, options_.withUserObject);
    } catch (const DispatchError& e) {
        exec.error = e;
        return exec;
    }
    exec.result = dispatch(exec.context, options_.withUserObject);
    return exec;
}

int Parser::run(std::string_view text, std::any* user) const {
    const auto ctx = parse(text, user);
    if (!ctx.terminal()) return fail(ctx, describeFailure(ctx));
    try {
        checkDispatch(ctx, options_.withUserObject);
    } catch (const DispatchError& e) {
        return fail(ctx, e.what());
    }
    return dispatch(ctx, options_.withUserObject);
}

std::vector<std::string> Parser::complete(std::string_view text, std::string_view partial) const {
    return cmdtree::complete(match(text, nullptr, false), partial);
}

std::vector<std::string> Parser::completeLine(std::string_view line) const {
    const auto tokens = utils::tokenize(line);
    // The last token is still being typed only if it runs to the end of the line; an open
    // quote keeps it running past trailing spaces.
    if (tokens.empty() || tokens.back().end < line.size()) return complete(line, "");
    const auto& last = tokens.back();
    return complete(line.substr(0, last.begin), last.text);
}

std::vector<HelpEntry> Parser::help(std::string_view text) const {
    return cmdtree::help(match(text, nullptr, false));
}

void Parser::printHelp(std::string_view text) const {
    cmdtree::printHelp(out(), help(text), color::themeFor(out(), options_.colorMode, options_.colorTheme));
}

int Parser::fail(const Context& ctx, const std::string& message) const {
    std::string msg = message;
    if (options_.suggestions && ctx.outcome() == Outcome::NoMatch) {
        const auto tokens = utils::tokenize(ctx.remaining());
        std::vector<std::string> words;
        for (const auto child : ctx.currentNode().children()) {
            if (ctx.grammar().node(child).hidden() || !ctx.canEnter(child)) continue;
            for (auto& w : nodeCandidates(ctx, child, {})) words.push_back(std::move(w));
        }
        const auto sugg = tokens.empty()
                              ? std::vector<std::string>{}
                              : utils::suggest(tokens.front().text, words, options_.suggestionsMinimumDistance);
        if (!sugg.empty()) {
            msg += "\n\nDid you mean this?\n";
            for (const auto& s : sugg) msg += "  " + s + "\n";
        }
    }
    if (const auto* theme = color::themeFor(err(), options_.colorMode, options_.colorTheme)) {
        err() << theme->role(ColorRole::Error) << "Error:" << theme->reset << " " << msg;
    } else {
        err() << "Error: " << msg;
    }
    if (msg.empty() || msg.back() != '\n') err() << "\n";
    return 1;
}

} // namespace cmdtree
