#ifndef CMDTREE_DISPATCHER_HPP
#define CMDTREE_DISPATCHER_HPP

#include <optional>
#include <string>

#include "context.hpp"

namespace cmdtree {

// Result of Parser::execute(): the parse Context plus either the callback's return value or the
// reason nothing was dispatched. `incomplete` is set alongside `error` when the input did not
// reach an action; a configuration error (missing user object, no callback) sets `error` only.
struct Execution {
    Context context;
    std::optional<int> result;
    std::optional<DispatchError> error;
    std::optional<IncompleteCommandError> incomplete;

    [[nodiscard]] bool ok() const { return result.has_value(); }
};

// Human readable reason a context cannot be dispatched ("unknown token \"x\"", ...).
std::string describeFailure(const Context& ctx);

// Invokes the callback bound to the Action the context stopped at and returns its result.
// Throws IncompleteCommandError if the context is not terminal, DispatchError if the callback
// needs a user object that was not supplied or no usable callback is bound. `withUserObject`
// applies to actions that do not set the flag themselves. Callback exceptions propagate.
int dispatch(const Context& ctx, bool withUserObject = false);

// The checks dispatch() makes before invoking the callback; throws what dispatch() would.
void checkDispatch(const Context& ctx, bool withUserObject = false);

} // namespace cmdtree

#endif // CMDTREE_DISPATCHER_HPP
