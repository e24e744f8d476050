#include <gtest/gtest.h>

#include <any>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cmdtree/parser.hpp"

using namespace cmdtree;

namespace {

struct Session {
    std::vector<std::string> log;
};

} // namespace

TEST(Dispatch, CallsCallbackWithTypedVariables) {
    std::int64_t seen = 0;
    auto root = Node::root();
    root.add(Node::variable("number", "", types::integer()).pattern("\\d+").add(Node::action("f", [&seen](const Variables& vars) {
        seen = vars.get<std::int64_t>("number");
        return 7;
    })));
    Grammar g(std::move(root));

    const auto exec = Parser(g).execute("1234");
    ASSERT_TRUE(exec.ok());
    EXPECT_EQ(*exec.result, 7);
    EXPECT_FALSE(exec.error.has_value());
    EXPECT_EQ(seen, 1234);
}

TEST(Dispatch, IncompleteCommandCarriesParsedAndRemaining) {
    int calls = 0;
    auto root = Node::root();
    root.add(Node("show").add(Node("ip").add(Node::action("ip", [&calls](const Variables&) { return ++calls; }))));
    Grammar g(std::move(root));
    const Parser parser(g);

    const auto partial = parser.execute("show");
    EXPECT_FALSE(partial.ok());
    ASSERT_TRUE(partial.error.has_value());
    ASSERT_TRUE(partial.incomplete.has_value());
    EXPECT_EQ(partial.incomplete->parsed(), "show");
    EXPECT_EQ(partial.incomplete->remaining(), "");
    EXPECT_STREQ(partial.error->what(), partial.incomplete->what());

    const auto bogus = parser.execute("show bogus");
    ASSERT_TRUE(bogus.incomplete.has_value());
    EXPECT_EQ(bogus.incomplete->parsed(), "show ");
    EXPECT_EQ(bogus.incomplete->remaining(), "bogus");
    EXPECT_NE(std::string(bogus.error->what()).find("bogus"), std::string::npos);

    EXPECT_EQ(calls, 0);
    EXPECT_THROW(dispatch(partial.context), IncompleteCommandError);
}

TEST(Dispatch, UserObjectIsPassedFirst) {
    auto root = Node::root();
    root.add(Node("log").add(Node::variable("msg", "").add(Node::action("log", [](std::any& user, const Variables& vars) {
        std::any_cast<Session&>(user).log.push_back(vars.get<std::string>("msg"));
        return 0;
    }))));
    Grammar g(std::move(root));
    const Parser parser(g);

    std::any session = Session{};
    EXPECT_TRUE(parser.execute("log hello", &session).ok());
    EXPECT_TRUE(parser.execute("log world", &session).ok());
    EXPECT_EQ(std::any_cast<Session&>(session).log, (std::vector<std::string>{"hello", "world"}));

    const auto missing = parser.execute("log hello");
    EXPECT_FALSE(missing.ok());
    ASSERT_TRUE(missing.error.has_value());
    EXPECT_FALSE(missing.incomplete.has_value());
    EXPECT_STREQ(missing.error->what(), "action /log/msg/#0 needs a user object");
    EXPECT_EQ(std::any_cast<Session&>(session).log.size(), 2u);
}

TEST(Dispatch, ParserDefaultForUserObject) {
    auto root = Node::root();
    root.add(Node("plain").add(Node::action("plain", [](const Variables&) { return 1; })),
             Node("opted").add(Node::action("opted", [](const Variables&) { return 2; }).withUserObject(false)));
    Grammar g(std::move(root));

    Parser::Options options;
    options.withUserObject = true;
    const Parser parser(g, options);
    std::any user = 0;

    const auto plain = parser.execute("plain", &user);
    ASSERT_TRUE(plain.error.has_value());
    EXPECT_STREQ(plain.error->what(), "action /plain/#0 needs a user object but its callback does not take one");
    EXPECT_EQ(*parser.execute("opted", &user).result, 2);
}

TEST(Dispatch, MissingCallbackIsAConfigurationError) {
    auto root = Node::root();
    root.add(Node("x").add(Node::action("x", Callback{})));
    Grammar g(std::move(root));
    const auto exec = Parser(g).execute("x");
    EXPECT_FALSE(exec.ok());
    ASSERT_TRUE(exec.error.has_value());
    EXPECT_FALSE(exec.incomplete.has_value());
    EXPECT_STREQ(exec.error->what(), "no callback bound to action /x/#0");
    EXPECT_THROW(dispatch(exec.context), DispatchError);
}

TEST(Dispatch, UserCallbackWithoutUserObjectIsReturned) {
    int calls = 0;
    auto root = Node::root();
    root.add(Node("x").add(Node::action("x", [&calls](std::any&, const Variables&) { return ++calls; })));
    Grammar g(std::move(root));

    const auto exec = Parser(g).execute("x");
    EXPECT_FALSE(exec.ok());
    ASSERT_TRUE(exec.error.has_value());
    EXPECT_STREQ(exec.error->what(), "action /x/#0 needs a user object");
    EXPECT_EQ(calls, 0);
}

TEST(Dispatch, DispatchErrorsThrownByCallbacksPropagate) {
    auto root = Node::root();
    root.add(Node("x").add(Node::action("x", [](const Variables&) -> int { throw DispatchError("from callback"); })));
    Grammar g(std::move(root));
    EXPECT_THROW((void)Parser(g).execute("x"), DispatchError);
}

TEST(Dispatch, CallbackExceptionsPropagate) {
    auto root = Node::root();
    root.add(Node("boom").add(Node::action("boom", [](const Variables&) -> int { throw std::logic_error("boom"); })));
    Grammar g(std::move(root));
    EXPECT_THROW((void)Parser(g).execute("boom"), std::logic_error);
    EXPECT_THROW((void)Parser(g).run("boom"), std::logic_error);
}

TEST(Run, ReturnsCallbackResult) {
    auto root = Node::root();
    root.add(Node("ok").add(Node::action("ok", [](const Variables&) { return 3; })));
    Grammar g(std::move(root));
    std::ostringstream err;
    Parser parser(g);
    parser.setErr(err);
    EXPECT_EQ(parser.run("ok"), 3);
    EXPECT_TRUE(err.str().empty());
}

TEST(Run, ReportsErrorsWithSuggestions) {
    auto root = Node::root();
    root.add(Node("show").add(Node::action("show", [](const Variables&) { return 0; })),
             Node("shutdown").add(Node::action("shutdown", [](const Variables&) { return 0; })));
    Grammar g(std::move(root));
    std::ostringstream err;
    Parser parser(g);
    parser.setErr(err);

    EXPECT_EQ(parser.run("shwo"), 1);
    EXPECT_EQ(err.str(), "Error: unknown token \"shwo\"\n\nDid you mean this?\n  show\n");

    err.str("");
    EXPECT_EQ(parser.run(""), 1);
    EXPECT_EQ(err.str(), "Error: empty command\n");
}

TEST(Run, SuggestionsCanBeDisabled) {
    auto root = Node::root();
    root.add(Node("show").add(Node::action("show", [](const Variables&) { return 0; })));
    Grammar g(std::move(root));
    Parser::Options options;
    options.suggestions = false;
    std::ostringstream err;
    Parser parser(g, options);
    parser.setErr(err);

    EXPECT_EQ(parser.run("shwo"), 1);
    EXPECT_EQ(err.str(), "Error: unknown token \"shwo\"\n");
}

TEST(Run, ReportsDispatchErrors) {
    auto root = Node::root();
    root.add(Node("x").add(Node::action("x", [](std::any&, const Variables&) { return 0; })));
    Grammar g(std::move(root));
    std::ostringstream err;
    Parser parser(g);
    parser.setErr(err);
    EXPECT_EQ(parser.run("x"), 1);
    EXPECT_EQ(err.str(), "Error: action /x/#0 needs a user object\n");
}
