#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "cmdtree/cmdtree.hpp"

int main(int argc, char** argv) {
    using cmdtree::Node;
    namespace types = cmdtree::types;

    auto dump = [](const cmdtree::Variables& vars) {
        for (const auto& name : vars.names()) {
            const auto* entry = vars.find(name);
            std::cout << name << (entry->sequence ? "[]" : "") << ":";
            for (const auto& v : entry->values) std::cout << " " << cmdtree::toString(v);
            std::cout << "\n";
        }
        return 0;
    };

    auto root = Node::root();
    root.add(Node("ping", "Ping a host")
                 .add(Node::variable("host", "Host name or IPv4 address", types::host())
                          .add(Node::action("Send one ping", dump),
                               Node("count", "Number of pings")
                                   .add(Node::variable("n", "Count", types::integer()).add(Node::action("Send pings", dump))))),
             Node("enable", "Toggle a feature")
                 .add(Node::variable("flag", "on/off", types::boolean()).add(Node::action("Toggle", dump))),
             Node("tag", "Attach up to three tags")
                 .add(Node::variable("tag", "Tag", types::word())
                          .traversals(3)
                          .varName("tags")
                          .add(Node::alias("/tag/tag"), Node::action("Store tags", dump))),
             Node("mail", "Send mail").add(Node::variable("to", "Recipient", types::email()).add(Node::action("Send", dump))));
    const cmdtree::Grammar grammar(std::move(root));

    std::string line;
    for (int i = 1; i < argc; ++i) {
        if (i > 1) line += " ";
        line += argv[i];
    }
    return cmdtree::Parser(grammar).run(line);
}
