#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "cmdtree/parser.hpp"

using namespace cmdtree;

namespace {

int noop(const Variables&) { return 0; }

struct Snapshot {
    std::vector<NodeId> history;
    Variables vars;
    std::string parsed;
    std::string remaining;
    Outcome outcome{Outcome::NoMatch};
    std::vector<std::string> completions;

    bool operator==(const Snapshot& other) const {
        return history == other.history && vars == other.vars && parsed == other.parsed &&
               remaining == other.remaining && outcome == other.outcome && completions == other.completions;
    }
};

Snapshot snapshot(const Parser& parser, const std::string& line) {
    const auto ctx = parser.parse(line);
    return Snapshot{ctx.history(), ctx.vars(), std::string(ctx.parsed()), std::string(ctx.remaining()),
                    ctx.outcome(), parser.completeLine(line + " ")};
}

} // namespace

TEST(Concurrency, OneGrammarServesParallelParses) {
    auto root = Node::root();
    root.add(Node("show").add(Node("interfaces").add(Node::action("List", noop)),
                              Node::variable("count", "", types::integer()).add(Node::action("Count", noop))),
             Node("tag").add(Node::variable("name", "", types::word()).traversals(0).add(Node::alias("/tag/name"),
                                                                                        Node::action("Tag", noop))),
             Node("no").add(Node::alias("/show/*")));
    const Grammar grammar(std::move(root));
    const Parser parser(grammar);

    const std::vector<std::string> lines{"show interfaces", "show 42", "tag a b c d", "no interfaces", "show bogus", ""};
    std::vector<Snapshot> expected;
    for (const auto& line : lines) expected.push_back(snapshot(parser, line));

    constexpr int kThreads = 8;
    constexpr int kRounds = 200;
    std::vector<std::vector<int>> mismatches(kThreads, std::vector<int>(lines.size(), 0));
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int round = 0; round < kRounds; ++round) {
                for (std::size_t i = 0; i < lines.size(); ++i) {
                    const auto& line = lines[(i + static_cast<std::size_t>(t)) % lines.size()];
                    const auto index = (i + static_cast<std::size_t>(t)) % lines.size();
                    if (!(snapshot(parser, line) == expected[index])) ++mismatches[t][index];
                }
            }
        });
    }
    for (auto& thread : threads) thread.join();

    for (int t = 0; t < kThreads; ++t) {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            EXPECT_EQ(mismatches[t][i], 0) << "thread " << t << " line \"" << lines[i] << "\"";
        }
    }
    EXPECT_TRUE(expected[0].history.size() == 3u);
    EXPECT_EQ(expected[2].vars.getAll<std::string>("name"), (std::vector<std::string>{"a", "b", "c", "d"}));
}
