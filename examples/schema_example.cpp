#include <iostream>
#include <string>

#include "cmdtree/cmdtree.hpp"

// Builds the grammar from the structure a declarative grammar file decodes to.
int main(int argc, char** argv) {
    cmdtree::Registry registry;
    registry.callback("greet", [](const cmdtree::Variables& vars) {
        for (const auto& who : vars.getAll<std::string>("who")) std::cout << "hello " << who << "\n";
        return 0;
    });

    cmdtree::NodeDescription root{"root", {}, {}};
    root.children.push_back({"node", {{"name", "greet"}, {"help", "Say hello"}}, {}});
    auto& greet = root.children.back();
    greet.children.push_back({"variable", {{"name", "who"}, {"type", "word"}, {"traversals", "0"}, {"help", "Names"}}, {}});
    auto& who = greet.children.back();
    who.children.push_back({"alias", {{"target", "."}}, {}});
    who.children.push_back({"action", {{"callback", "greet"}, {"help", "Greet them"}}, {}});

    try {
        const auto grammar = cmdtree::buildGrammar(root, registry);
        std::string line;
        for (int i = 1; i < argc; ++i) {
            if (i > 1) line += " ";
            line += argv[i];
        }
        return cmdtree::Parser(grammar).run(line);
    } catch (const cmdtree::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
