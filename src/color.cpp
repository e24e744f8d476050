#include "cmdtree/color.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace cmdtree::color {

namespace {

std::FILE* fileOf(Stream stream) {
    switch (stream) {
        case Stream::Stdout: return stdout;
        case Stream::Stderr: return stderr;
        case Stream::Other: return nullptr;
    }
    return nullptr;
}

bool envNoColor() {
    // https://no-color.org/
    return std::getenv("NO_COLOR") != nullptr;
}

bool envTermDumb() {
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) == "dumb";
}

std::string rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    return "\x1b[38;2;" + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

const std::string kBold = "\x1b[1m";
const std::string kDim = "\x1b[2m";

} // namespace

Stream streamOf(const std::ostream& os) {
    if (&os == &std::cout) return Stream::Stdout;
    if (&os == &std::cerr || &os == &std::clog) return Stream::Stderr;
    return Stream::Other;
}

bool isTty(Stream stream) {
    std::FILE* f = fileOf(stream);
    if (f == nullptr) return false;
#if defined(_WIN32)
    return _isatty(_fileno(f)) != 0;
#else
    return ::isatty(fileno(f)) != 0;
#endif
}

bool enableVirtualTerminalProcessing(Stream stream) {
#if defined(_WIN32)
    HANDLE h = nullptr;
    switch (stream) {
        case Stream::Stdout: h = GetStdHandle(STD_OUTPUT_HANDLE); break;
        case Stream::Stderr: h = GetStdHandle(STD_ERROR_HANDLE); break;
        case Stream::Other: return false;
    }
    if (h == nullptr || h == INVALID_HANDLE_VALUE) return false;

    DWORD mode = 0;
    if (!GetConsoleMode(h, &mode)) return false;

    // ENABLE_VIRTUAL_TERMINAL_PROCESSING: 0x0004
    constexpr DWORD kEnableVt = 0x0004;
    if ((mode & kEnableVt) != 0) return true;
    return SetConsoleMode(h, mode | kEnableVt) != 0;
#else
    return stream != Stream::Other;
#endif
}

bool enabled(ColorMode mode, Stream stream) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never: return false;
        case ColorMode::Auto: break;
    }
    if (envNoColor() || envTermDumb()) return false;
    return isTty(stream) && enableVirtualTerminalProcessing(stream);
}

const ColorTheme& builtinTheme(ColorThemeName name) {
    // Truecolor escapes; terminals without truecolor approximate them.
    static const ColorTheme vscode = [] {
        ColorTheme t;
        t.keyword = kBold + rgb(78, 201, 176); // teal
        t.placeholder = rgb(156, 220, 254);    // light blue
        t.text = kDim + rgb(160, 160, 160);    // dim gray
        t.error = kBold + rgb(244, 71, 71);    // red
        return t;
    }();
    static const ColorTheme sublime = [] {
        ColorTheme t;
        t.keyword = kBold + rgb(166, 226, 46); // green
        t.placeholder = rgb(102, 217, 239);    // cyan
        t.text = kDim + rgb(160, 160, 160);
        t.error = kBold + rgb(249, 38, 114);   // pink
        return t;
    }();
    static const ColorTheme iterm2 = [] {
        ColorTheme t;
        t.keyword = "\x1b[1m\x1b[32m";
        t.placeholder = "\x1b[33m";
        t.text = "\x1b[2m";
        t.error = "\x1b[1m\x1b[31m";
        return t;
    }();
    switch (name) {
        case ColorThemeName::Vscode: return vscode;
        case ColorThemeName::Sublime: return sublime;
        case ColorThemeName::Iterm2: return iterm2;
    }
    return vscode;
}

} // namespace cmdtree::color
