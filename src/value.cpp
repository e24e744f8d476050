#include "cmdtree/value.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <regex>
#include <sstream>
#include <system_error>

#include "cmdtree/utils.hpp"

namespace {

using cmdtree::ParseFunc;
using cmdtree::VarValue;

bool tryParseSignedInt(std::string_view s, std::int64_t& out) {
    if (s.empty()) return false;
    const std::string tmp(s);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 10);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = static_cast<std::int64_t>(v);
    return true;
}

bool tryParseDouble(std::string_view s, double& out) {
    if (s.empty()) return false;
    const std::string tmp(s);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = v;
    return true;
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (auto& ch : out) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return out;
}

// ECMAScript has no inline (?i); spell each letter as a two-case bracket instead.
std::string caseless(std::string_view literal) {
    std::string out;
    for (const char ch : literal) {
        const auto uc = static_cast<unsigned char>(ch);
        if (std::isalpha(uc)) {
            out += '[';
            out += static_cast<char>(std::tolower(uc));
            out += static_cast<char>(std::toupper(uc));
            out += ']';
        } else {
            out += cmdtree::utils::escapeRegex(std::string_view(&ch, 1));
        }
    }
    return out;
}

std::vector<std::string> split(std::string_view s, char sep) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        const auto pos = s.find(sep, start);
        out.emplace_back(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

const std::vector<std::string_view>& trueWords() {
    static const std::vector<std::string_view> words{"true", "yes", "aye", "enable", "enabled", "on", "1"};
    return words;
}

const std::vector<std::string_view>& falseWords() {
    static const std::vector<std::string_view> words{"false", "no", "disable", "disabled", "off", "0"};
    return words;
}

const std::string kOctet = "(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)";
const std::string kIpPattern = kOctet + "\\." + kOctet + "\\." + kOctet + "\\." + kOctet;
const std::string kHostnamePattern = "[A-Za-z0-9][A-Za-z0-9_-]*(\\.[A-Za-z0-9][A-Za-z0-9_-]*)*";

std::optional<std::string> parseIp(std::string_view token, VarValue& out) {
    std::vector<std::int64_t> octets;
    for (const auto& part : split(token, '.')) {
        std::int64_t v = 0;
        if (!tryParseSignedInt(part, v) || v < 0 || v > 255) return std::string("invalid IPv4 address");
        octets.push_back(v);
    }
    if (octets.size() != 4) return std::string("invalid IPv4 address");
    out = std::move(octets);
    return std::nullopt;
}

class PatternType final : public cmdtree::VariableType {
public:
    PatternType(std::string name, std::string pattern, ParseFunc parse)
        : name_(std::move(name)), pattern_(std::move(pattern)), parse_(std::move(parse)) {}

    std::string type() const override { return name_; }
    std::string pattern() const override { return pattern_; }

    std::optional<std::string> parse(std::string_view token, VarValue& out) const override {
        if (!parse_) {
            out = std::string(token);
            return std::nullopt;
        }
        return parse_(token, out);
    }

private:
    std::string name_;
    std::string pattern_;
    ParseFunc parse_;
};

class FileType final : public cmdtree::VariableType {
public:
    explicit FileType(cmdtree::types::FileOptions options) : options_(std::move(options)) {}

    std::string type() const override { return "file"; }
    std::string pattern() const override { return "\\S+"; }

    std::optional<std::string> parse(std::string_view token, VarValue& out) const override {
        const auto path = expandHome(std::string(token));
        if (!matchFile(path, options_.allowDirectories)) return "no such file: " + std::string(token);
        out = std::string(token);
        return std::nullopt;
    }

    std::vector<std::string> candidates(std::string_view partial) const override {
        namespace fs = std::filesystem;
        const std::string text(partial);
        const auto slash = text.rfind('/');
        const std::string dirPart = slash == std::string::npos ? std::string() : text.substr(0, slash + 1);
        const std::string filePart = slash == std::string::npos ? text : text.substr(slash + 1);
        const fs::path dir = dirPart.empty() ? fs::path(".") : fs::path(expandHome(dirPart));

        std::vector<std::string> out;
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) return out;
        for (const auto& entry : it) {
            const auto name = entry.path().filename().string();
            if (name.rfind(filePart, 0) != 0) continue;
            if (!options_.allowDotfiles && !name.empty() && name[0] == '.' && filePart.rfind('.', 0) != 0) continue;
            std::error_code dirEc;
            if (entry.is_directory(dirEc)) {
                out.push_back(dirPart + name + "/");
                continue;
            }
            if (matchFile(entry.path().string(), false)) out.push_back(dirPart + name);
        }
        return out;
    }

private:
    static std::string expandHome(std::string path) {
        if (path.empty() || path[0] != '~') return path;
        const char* home = std::getenv("HOME");
        if (home == nullptr) return path;
        if (path.size() == 1 || path[1] == '/') return std::string(home) + path.substr(1);
        return path;
    }

    bool matchFile(const std::string& path, bool matchDirectories) const {
        namespace fs = std::filesystem;
        std::error_code ec;
        if (fs::is_directory(path, ec)) return matchDirectories;
        if (!fs::exists(path, ec)) return false;
        const auto base = fs::path(path).filename().string();
        if (!options_.allowDotfiles && !base.empty() && base[0] == '.') return false;
        for (const auto& exclude : options_.excludes) {
            if (cmdtree::utils::globMatch(exclude, base)) return false;
        }
        for (const auto& include : options_.includes) {
            if (cmdtree::utils::globMatch(include, base)) return true;
        }
        return false;
    }

    cmdtree::types::FileOptions options_;
};

} // namespace

namespace cmdtree {

namespace types {

VariableTypePtr text() {
    static const auto t = std::make_shared<PatternType>("text", "\\S+", ParseFunc{});
    return t;
}

VariableTypePtr word() {
    static const auto t = std::make_shared<PatternType>("word", "[A-Za-z_]\\w*", ParseFunc{});
    return t;
}

VariableTypePtr string() {
    static const auto t = std::make_shared<PatternType>(
        "string",
        R"([^\s"']+|"([^"\\]|\\.)*"|'([^'\\]|\\.)*')",
        [](std::string_view token, VarValue& out) -> std::optional<std::string> {
            if (token.empty() || (token.front() != '"' && token.front() != '\'')) {
                out = std::string(token);
                return std::nullopt;
            }
            if (token.size() < 2 || token.back() != token.front()) return std::string("unterminated quoted string");
            std::string value;
            const auto body = token.substr(1, token.size() - 2);
            for (std::size_t i = 0; i < body.size(); ++i) {
                if (body[i] != '\\' || i + 1 >= body.size()) {
                    value.push_back(body[i]);
                    continue;
                }
                const char esc = body[++i];
                switch (esc) {
                    case 'n': value.push_back('\n'); break;
                    case 't': value.push_back('\t'); break;
                    case 'r': value.push_back('\r'); break;
                    case '0': value.push_back('\0'); break;
                    default: value.push_back(esc); break;
                }
            }
            out = std::move(value);
            return std::nullopt;
        });
    return t;
}

VariableTypePtr integer() {
    static const auto t = std::make_shared<PatternType>(
        "integer", "[-+]?\\d+", [](std::string_view token, VarValue& out) -> std::optional<std::string> {
            std::int64_t v = 0;
            if (!tryParseSignedInt(token, v)) return std::string("integer out of range");
            out = v;
            return std::nullopt;
        });
    return t;
}

VariableTypePtr floating() {
    static const auto t = std::make_shared<PatternType>(
        "float", "[-+]?[0-9]*\\.?[0-9]+([eE][-+]?[0-9]+)?", [](std::string_view token, VarValue& out) -> std::optional<std::string> {
            double v = 0.0;
            if (!tryParseDouble(token, v)) return std::string("invalid float");
            out = v;
            return std::nullopt;
        });
    return t;
}

VariableTypePtr boolean() {
    static const auto t = [] {
        std::string pattern;
        for (const auto* words : {&trueWords(), &falseWords()}) {
            for (const auto w : *words) {
                if (!pattern.empty()) pattern += '|';
                pattern += caseless(w);
            }
        }
        return std::make_shared<PatternType>(
            "boolean", "(" + pattern + ")", [](std::string_view token, VarValue& out) -> std::optional<std::string> {
                const auto l = lower(token);
                for (const auto w : trueWords()) {
                    if (l == w) {
                        out = true;
                        return std::nullopt;
                    }
                }
                for (const auto w : falseWords()) {
                    if (l == w) {
                        out = false;
                        return std::nullopt;
                    }
                }
                return std::string("invalid boolean");
            });
    }();
    return t;
}

VariableTypePtr ip() {
    static const auto t = std::make_shared<PatternType>("ip", kIpPattern, parseIp);
    return t;
}

VariableTypePtr hostname() {
    static const auto t = std::make_shared<PatternType>(
        "hostname", kHostnamePattern, [](std::string_view token, VarValue& out) -> std::optional<std::string> {
            out = split(token, '.');
            return std::nullopt;
        });
    return t;
}

VariableTypePtr host() {
    static const auto t = std::make_shared<PatternType>(
        "host", "(" + kIpPattern + ")|(" + kHostnamePattern + ")", [](std::string_view token, VarValue& out) -> std::optional<std::string> {
            static const std::regex ipRe(kIpPattern);
            if (std::regex_match(token.begin(), token.end(), ipRe)) return parseIp(token, out);
            out = split(token, '.');
            return std::nullopt;
        });
    return t;
}

VariableTypePtr email() {
    static const auto t = std::make_shared<PatternType>("email", "[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}", ParseFunc{});
    return t;
}

VariableTypePtr uri() {
    static const auto t = std::make_shared<PatternType>(
        "uri",
        R"(([a-zA-Z][0-9a-zA-Z+.-]*:)?/{0,2}[0-9a-zA-Z;/?:@&=+$._!~*'()%-]+(#[0-9a-zA-Z;/?:@&=+$._!~*'()%-]+)?)",
        ParseFunc{});
    return t;
}

VariableTypePtr ldapDn() {
    static const auto t = std::make_shared<PatternType>("ldapdn", "(\\w+=\\w+)(,(\\w+=\\w+))*", ParseFunc{});
    return t;
}

VariableTypePtr file(FileOptions options) {
    return std::make_shared<FileType>(std::move(options));
}

VariableTypePtr custom(std::string name, std::string pattern, ParseFunc parse) {
    return std::make_shared<PatternType>(std::move(name), std::move(pattern), std::move(parse));
}

VariableTypePtr byName(std::string_view name) {
    static const std::unordered_map<std::string, VariableTypePtr (*)()> builtins{
        {"text", &text},
        {"word", &word},
        {"string", &string},
        {"integer", &integer},
        {"float", &floating},
        {"boolean", &boolean},
        {"ip", &ip},
        {"hostname", &hostname},
        {"host", &host},
        {"email", &email},
        {"uri", &uri},
        {"ldapdn", &ldapDn},
    };
    const auto key = lower(name);
    if (key == "file") return file();
    const auto it = builtins.find(key);
    return it == builtins.end() ? nullptr : it->second();
}

} // namespace types

std::string toString(const VarValue& value) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                oss << (v ? "true" : "false");
            } else if constexpr (std::is_same_v<T, std::vector<std::int64_t>>) {
                for (std::size_t i = 0; i < v.size(); ++i) oss << (i ? "." : "") << v[i];
            } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                for (std::size_t i = 0; i < v.size(); ++i) oss << (i ? "." : "") << v[i];
            } else {
                oss << v;
            }
        },
        value);
    return oss.str();
}

} // namespace cmdtree
