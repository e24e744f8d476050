#ifndef CMDTREE_ERRORS_HPP
#define CMDTREE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace cmdtree {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed node declaration: bad pattern, duplicate sibling name, children on an Action...
class GrammarDefinitionError : public Error {
public:
    using Error::Error;
};

class AliasResolutionError : public Error {
public:
    AliasResolutionError(std::string aliasPath, std::string target, const std::string& reason)
        : Error("cannot resolve alias " + aliasPath + " -> \"" + target + "\": " + reason),
          aliasPath_(std::move(aliasPath)),
          target_(std::move(target)) {}

    [[nodiscard]] const std::string& aliasPath() const { return aliasPath_; }
    [[nodiscard]] const std::string& target() const { return target_; }

private:
    std::string aliasPath_;
    std::string target_;
};

// Rejected declarative input: unknown variant, attribute outside the schema, bad attribute value.
class SchemaError : public Error {
public:
    using Error::Error;
};

class DispatchError : public Error {
public:
    using Error::Error;
};

class IncompleteCommandError : public DispatchError {
public:
    IncompleteCommandError(std::string parsed, std::string remaining, const std::string& reason)
        : DispatchError(reason), parsed_(std::move(parsed)), remaining_(std::move(remaining)) {}

    [[nodiscard]] const std::string& parsed() const { return parsed_; }
    [[nodiscard]] const std::string& remaining() const { return remaining_; }

private:
    std::string parsed_;
    std::string remaining_;
};

// Recorded in the Context when a Variable's parse hook rejects a matched token.
struct VariableParseError {
    std::string node;    // grammar path of the variable
    std::string token;   // matched text
    std::string message; // hook error
};

} // namespace cmdtree

#endif // CMDTREE_ERRORS_HPP
