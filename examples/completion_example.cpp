#include <iostream>
#include <string>
#include <vector>

#include "cmdtree/cmdtree.hpp"

// Prints the completions for the given words, as a shell completion hook would:
//   completion_example "kill T"
//   completion_example "open ./"
int main(int argc, char** argv) {
    using cmdtree::Node;

    auto root = Node::root();
    root.add(Node("kill", "Send a signal")
                 .add(Node::variable("signal", "Signal name")
                          .matchCandidates()
                          .candidates(cmdtree::staticCandidates({"TERM", "KILL", "HUP", "INT"}))
                          .add(Node::action("Send it", [](const cmdtree::Variables&) { return 0; }))),
             Node("open", "Open a file")
                 .add(Node::variable("file", "File", cmdtree::types::file({{"*"}, {}, false, true}))
                          .add(Node::action("Open it", [](const cmdtree::Variables&) { return 0; }))),
             Node("mode", "Switch mode").add(Node::variable("mode", "Mode").pattern("fast|slow|auto")),
             Node("internal", "Not offered").hidden());
    const cmdtree::Grammar grammar(std::move(root));
    const cmdtree::Parser parser(grammar);

    const std::string line = argc > 1 ? argv[1] : "";
    for (const auto& candidate : parser.completeLine(line)) std::cout << "'" << candidate << "'\n";
    return 0;
}
