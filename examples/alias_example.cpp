#include <iostream>
#include <string>

#include "cmdtree/cmdtree.hpp"

// "show" and "no show" share one subtree: the alias attaches the nodes below /show under /no.
int main(int argc, char** argv) {
    using cmdtree::Node;

    auto print = [](const char* what) {
        return [what](const cmdtree::Variables& vars) {
            std::cout << what;
            for (const auto& name : vars.names()) std::cout << " " << name << "=" << cmdtree::toString(vars.find(name)->values.back());
            std::cout << "\n";
            return 0;
        };
    };

    auto root = Node::root();
    root.add(Node("show", "Show state")
                 .add(Node("interfaces", "Network interfaces").add(Node::action("Show interfaces", print("interfaces"))),
                      Node("routes", "Routing table").add(Node::action("Show routes", print("routes")))),
             Node("no", "Negate a command").add(Node::alias("/show/*")),
             Node("repeat", "Run show with a count")
                 .add(Node::variable("count", "Times", cmdtree::types::integer()).add(Node::alias("/show"))));
    const cmdtree::Grammar grammar(std::move(root));

    for (const auto id : grammar.walk()) std::cout << grammar.path(id) << "\n";

    std::string line;
    for (int i = 1; i < argc; ++i) {
        if (i > 1) line += " ";
        line += argv[i];
    }
    return cmdtree::Parser(grammar).run(line);
}
