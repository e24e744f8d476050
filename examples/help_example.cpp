#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "cmdtree/cmdtree.hpp"

// Context help as an interactive shell shows it after "?":
//   help_example
//   help_example interface
//   help_example --color=always --theme=iterm2 interface
int main(int argc, char** argv) {
    using cmdtree::Node;

    auto root = Node::root();
    root.add(Node("interface", "Configure an interface")
                 .helpGroup(1)
                 .add(Node::variable("name", "Interface name").help([](const cmdtree::Context&) {
                     return std::vector<cmdtree::HelpPair>{{"eth0", "Onboard ethernet"}, {"wlan0", "Wireless"}};
                 })),
             Node("show", "Show running state").helpOrder(-1),
             Node("exit", "Leave the shell").helpGroup(2),
             Node("debug", "Developer commands").hidden(),
             Node::action("Apply the configuration", [](const cmdtree::Variables&) { return 0; }));
    const cmdtree::Grammar grammar(std::move(root));

    cmdtree::Parser::Options options;
    options.colorTheme = cmdtree::ColorThemeName::Sublime;

    std::string line;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg.rfind("--color=", 0) == 0) {
            const auto mode = cmdtree::color::parseMode(arg.substr(8));
            if (!mode) {
                std::cerr << "Error: unknown color mode \"" << arg.substr(8) << "\"\n";
                return 1;
            }
            options.colorMode = *mode;
            continue;
        }
        if (arg.rfind("--theme=", 0) == 0) {
            const auto theme = cmdtree::color::parseTheme(arg.substr(8));
            if (!theme) {
                std::cerr << "Error: unknown theme \"" << arg.substr(8) << "\"\n";
                return 1;
            }
            options.colorTheme = *theme;
            continue;
        }
        if (!line.empty()) line += " ";
        line += arg;
    }
    const cmdtree::Parser parser(grammar, options);
    parser.printHelp(line);
    return 0;
}
