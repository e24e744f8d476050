#include "cmdtree/dispatcher.hpp"

#include "cmdtree/utils.hpp"

namespace cmdtree {

std::string describeFailure(const Context& ctx) {
    switch (ctx.outcome()) {
        case Outcome::Terminal: return {};
        case Outcome::Partial: {
            const auto tokens = utils::tokenize(ctx.parsed());
            if (tokens.empty()) return "empty command";
            return "incomplete command \"" + tokens.back().text + "\"";
        }
        case Outcome::NoMatch: {
            const auto tokens = utils::tokenize(ctx.remaining());
            return "unknown token \"" + (tokens.empty() ? std::string() : tokens.front().text) + "\"";
        }
        case Outcome::ParseError: {
            const auto& e = *ctx.error();
            return "invalid value \"" + e.token + "\" for " + e.node + ": " + e.message;
        }
    }
    return {};
}

void checkDispatch(const Context& ctx, bool withUserObject) {
    if (!ctx.terminal()) {
        throw IncompleteCommandError(std::string(ctx.parsed()), std::string(ctx.remaining()), describeFailure(ctx));
    }

    const auto& action = ctx.currentNode();
    if (action.withUserObject().value_or(withUserObject)) {
        if (!action.userCallback()) {
            throw DispatchError("action " + action.path() + " needs a user object but its callback does not take one");
        }
        if (ctx.user() == nullptr) throw DispatchError("action " + action.path() + " needs a user object");
        return;
    }
    if (!action.callback()) {
        if (action.userCallback()) {
            throw DispatchError("action " + action.path() + " takes a user object but is configured without one");
        }
        throw DispatchError("no callback bound to action " + action.path());
    }
}

int dispatch(const Context& ctx, bool withUserObject) {
    checkDispatch(ctx, withUserObject);
    const auto& action = ctx.currentNode();
    if (action.withUserObject().value_or(withUserObject)) return action.userCallback()(*ctx.user(), ctx.vars());
    return action.callback()(ctx.vars());
}

} // namespace cmdtree
