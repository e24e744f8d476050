#include <iostream>
#include <string>

#include "cmdtree/cmdtree.hpp"

int main(int argc, char** argv) {
    auto root = cmdtree::Node::root();
    root.add(cmdtree::Node("print", "Prints a message to the console")
                 .add(cmdtree::Node::variable("message", "Message to print", cmdtree::types::string())
                          .add(cmdtree::Node::action("Print it", [](const cmdtree::Variables& vars) {
                              std::cout << vars.get<std::string>("message") << "\n";
                              return 0;
                          }))),
             cmdtree::Node("version", "Print the version number").add(cmdtree::Node::action("Print it", [](const cmdtree::Variables&) {
                 std::cout << "0.1.0\n";
                 return 0;
             })));
    const cmdtree::Grammar grammar(std::move(root));

    std::string line;
    for (int i = 1; i < argc; ++i) {
        if (i > 1) line += " ";
        line += argv[i];
    }
    return cmdtree::Parser(grammar).run(line);
}
