#ifndef CMDTREE_COLOR_HPP
#define CMDTREE_COLOR_HPP

#include <ostream>
#include <optional>
#include <string>
#include <string_view>

namespace cmdtree {

enum class ColorMode {
    Auto,
    Always,
    Never,
};

enum class ColorThemeName {
    Vscode,
    Sublime,
    Iterm2,
};

enum class ColorRole {
    Keyword,
    Placeholder,
    Text,
    Error,
};

struct ColorTheme {
    std::string reset{"\x1b[0m"};
    std::string keyword;     // literal help keys ("show")
    std::string placeholder; // variable and action keys ("<name>", "<eol>")
    std::string text;        // help text
    std::string error;

    [[nodiscard]] const std::string& role(ColorRole r) const {
        switch (r) {
            case ColorRole::Keyword: return keyword;
            case ColorRole::Placeholder: return placeholder;
            case ColorRole::Text: return text;
            case ColorRole::Error: return error;
        }
        return text;
    }
};

namespace color {

enum class Stream {
    Stdout,
    Stderr,
    Other,
};

// Which standard stream `os` writes to; Other for string streams and files.
Stream streamOf(const std::ostream& os);

// Returns true if the underlying stream is a terminal.
bool isTty(Stream stream);

// Windows: enables VT sequences for the console. Non-Windows: no-op returning true.
bool enableVirtualTerminalProcessing(Stream stream);

// Auto: color only when `stream` is a terminal and neither NO_COLOR nor TERM=dumb is set.
bool enabled(ColorMode mode, Stream stream);

const ColorTheme& builtinTheme(ColorThemeName name);

// Theme to paint `os` with under `mode`, or null for plain output.
inline const ColorTheme* themeFor(const std::ostream& os, ColorMode mode, ColorThemeName name) {
    return enabled(mode, streamOf(os)) ? &builtinTheme(name) : nullptr;
}

inline std::optional<ColorMode> parseMode(std::string_view s) {
    if (s == "auto") return ColorMode::Auto;
    if (s == "always") return ColorMode::Always;
    if (s == "never") return ColorMode::Never;
    return std::nullopt;
}

inline std::optional<ColorThemeName> parseTheme(std::string_view s) {
    if (s == "vscode") return ColorThemeName::Vscode;
    if (s == "sublime") return ColorThemeName::Sublime;
    if (s == "iterm2") return ColorThemeName::Iterm2;
    return std::nullopt;
}

} // namespace color
} // namespace cmdtree

#endif // CMDTREE_COLOR_HPP
