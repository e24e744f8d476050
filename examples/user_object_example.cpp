#include <any>
#include <iostream>
#include <map>
#include <string>

#include "cmdtree/cmdtree.hpp"

namespace {

struct Store {
    std::map<std::string, std::string> values;
};

} // namespace

int main() {
    using cmdtree::Node;

    auto root = Node::root();
    root.add(Node("set", "Set a key")
                 .add(Node::variable("key", "Key", cmdtree::types::word())
                          .add(Node::variable("value", "Value", cmdtree::types::string())
                                   .add(Node::action("Store it", [](std::any& user, const cmdtree::Variables& vars) {
                                       std::any_cast<Store&>(user).values[vars.get<std::string>("key")] =
                                           vars.get<std::string>("value");
                                       return 0;
                                   })))),
             Node("get", "Read a key")
                 .add(Node::variable("key", "Key", cmdtree::types::word())
                          .add(Node::action("Print it", [](std::any& user, const cmdtree::Variables& vars) {
                              const auto& values = std::any_cast<Store&>(user).values;
                              const auto it = values.find(vars.get<std::string>("key"));
                              if (it == values.end()) return 1;
                              std::cout << it->second << "\n";
                              return 0;
                          }))));
    const cmdtree::Grammar grammar(std::move(root));
    const cmdtree::Parser parser(grammar);

    std::any store = Store{};
    for (const char* line : {"set greeting \"hello world\"", "get greeting", "get missing", "set"}) {
        std::cout << "> " << line << "\n";
        const int rc = parser.run(line, &store);
        std::cout << "exit " << rc << "\n";
    }
    return 0;
}
