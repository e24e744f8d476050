#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "cmdtree/parser.hpp"

using namespace cmdtree;

namespace {

int noop(const Variables&) { return 0; }

std::vector<std::string> keys(const std::vector<HelpEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& e : entries) out.push_back(e.key);
    return out;
}

} // namespace

TEST(Help, KeysByNodeKind) {
    auto root = Node::root();
    root.add(Node("show", "Show things").add(Node::variable("count", "How many", types::integer()),
                                             Node::action("Show everything", noop),
                                             Node("brief", "Short form")));
    Grammar g(std::move(root));
    const Parser parser(g);

    const auto top = parser.help("");
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].key, "show");
    EXPECT_EQ(top[0].text, "Show things");

    const auto entries = parser.help("show");
    EXPECT_EQ(keys(entries), (std::vector<std::string>{"<count>", "brief", "<eol>"}));
    EXPECT_EQ(entries.back().group, 9999);
}

TEST(Help, SortedByGroupThenOrderThenDeclaration) {
    auto root = Node::root();
    root.add(Node("c").helpGroup(1),
             Node("b").helpGroup(1).helpOrder(-1),
             Node("a").helpGroup(2),
             Node("z"),
             Node("y"));
    Grammar g(std::move(root));
    EXPECT_EQ(keys(Parser(g).help("")), (std::vector<std::string>{"z", "y", "b", "c", "a"}));
}

TEST(Help, ProvidersAreEvaluatedLazily) {
    int calls = 0;
    auto root = Node::root();
    root.add(Node("dyn").help([&calls](const Context& ctx) {
        ++calls;
        return std::vector<HelpPair>{{"one", "first at " + std::to_string(ctx.cursor())}, {"two", "second"}};
    }));
    Grammar g(std::move(root));
    const Parser parser(g);
    EXPECT_EQ(calls, 0);

    const auto entries = parser.help("");
    EXPECT_EQ(calls, 1);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].key, "one");
    EXPECT_EQ(entries[0].text, "first at 0");
    EXPECT_EQ(entries[1].key, "two");
}

TEST(Help, HiddenAndExhaustedNodesAreOmitted) {
    auto root = Node::root();
    root.add(Node("a", "A").add(Node::alias("/*")), Node("secret", "S").hidden());
    Grammar g(std::move(root));
    const Parser parser(g);
    EXPECT_EQ(keys(parser.help("")), (std::vector<std::string>{"a"}));
    EXPECT_TRUE(parser.help("a").empty());
}

TEST(Help, PrintHelpAlignsColumnsAndSeparatesGroups) {
    std::vector<HelpEntry> entries{
        {"show", "Show things", 0, 0, true},
        {"<count>", "How many", 0, 0, false},
        {"<eol>", "Run", 9999, 0, false},
    };
    std::ostringstream os;
    printHelp(os, entries);
    EXPECT_EQ(os.str(),
              "  show     Show things\n"
              "  <count>  How many\n"
              "\n"
              "  <eol>    Run\n");
}

TEST(Help, PrintHelpWithTheme) {
    ColorTheme theme;
    theme.keyword = "[K]";
    theme.placeholder = "[P]";
    theme.text = "[T]";
    theme.reset = "[R]";
    std::ostringstream os;
    printHelp(os, {{"show", "Show", 0, 0, true}, {"<n>", "", 0, 0, false}}, &theme);
    EXPECT_EQ(os.str(), "  [K]show[R]  [T]Show[R]\n  [P]<n>[R]\n");
}

TEST(Help, ParserPrintsToConfiguredStream) {
    auto root = Node::root();
    root.add(Node("show", "Show things"));
    Grammar g(std::move(root));

    Parser::Options options;
    options.colorMode = ColorMode::Never;
    Parser parser(g, options);
    std::ostringstream os;
    parser.setOut(os);
    parser.printHelp("");
    EXPECT_EQ(os.str(), "  show  Show things\n");
}
