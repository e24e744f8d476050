#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

#include "cmdtree/color.hpp"
#include "cmdtree/parser.hpp"

using namespace cmdtree;

TEST(Color, ParseModeAndTheme) {
    EXPECT_EQ(color::parseMode("always"), ColorMode::Always);
    EXPECT_EQ(color::parseMode("never"), ColorMode::Never);
    EXPECT_FALSE(color::parseMode("sometimes").has_value());
    EXPECT_EQ(color::parseTheme("iterm2"), ColorThemeName::Iterm2);
    EXPECT_FALSE(color::parseTheme("solarized").has_value());
}

TEST(Color, StreamOf) {
    std::ostringstream os;
    EXPECT_EQ(color::streamOf(std::cout), color::Stream::Stdout);
    EXPECT_EQ(color::streamOf(std::cerr), color::Stream::Stderr);
    EXPECT_EQ(color::streamOf(os), color::Stream::Other);
    EXPECT_FALSE(color::isTty(color::Stream::Other));
}

TEST(Color, ModeDecidesTheme) {
    std::ostringstream os;
    EXPECT_EQ(color::themeFor(os, ColorMode::Never, ColorThemeName::Vscode), nullptr);
    EXPECT_EQ(color::themeFor(os, ColorMode::Auto, ColorThemeName::Vscode), nullptr);
    const auto* theme = color::themeFor(os, ColorMode::Always, ColorThemeName::Sublime);
    ASSERT_NE(theme, nullptr);
    EXPECT_EQ(theme, &color::builtinTheme(ColorThemeName::Sublime));
    EXPECT_FALSE(theme->keyword.empty());
    EXPECT_FALSE(theme->error.empty());
}

TEST(Color, ErrorsArePaintedWhenForced) {
    auto root = Node::root();
    root.add(Node("show"));
    Grammar g(std::move(root));

    Parser::Options options;
    options.colorMode = ColorMode::Always;
    options.colorTheme = ColorThemeName::Iterm2;
    options.suggestions = false;
    std::ostringstream err;
    Parser parser(g, options);
    parser.setErr(err);

    EXPECT_EQ(parser.run("nope"), 1);
    const auto& theme = color::builtinTheme(ColorThemeName::Iterm2);
    EXPECT_EQ(err.str(), theme.error + "Error:" + theme.reset + " unknown token \"nope\"\n");
}
