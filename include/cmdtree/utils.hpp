#ifndef CMDTREE_UTILS_HPP
#define CMDTREE_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cmdtree::utils {

inline std::size_t levenshteinDistance(std::string_view a, std::string_view b) {
    const std::size_t n = a.size();
    const std::size_t m = b.size();
    if (n == 0) return m;
    if (m == 0) return n;

    std::vector<std::size_t> prev(m + 1), cur(m + 1);
    for (std::size_t j = 0; j <= m; ++j) prev[j] = j;

    for (std::size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        for (std::size_t j = 1; j <= m; ++j) {
            const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        prev.swap(cur);
    }
    return prev[m];
}

inline std::vector<std::string> suggest(std::string_view input,
                                        const std::vector<std::string>& candidates,
                                        std::size_t maxDistance = 2,
                                        std::size_t maxResults = 3) {
    struct Scored {
        std::string value;
        std::size_t score;
    };

    std::vector<Scored> scored;
    scored.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c.empty()) continue;
        if (c.rfind(input, 0) == 0) {
            scored.push_back({c, 0});
            continue;
        }
        scored.push_back({c, levenshteinDistance(input, c)});
    }

    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) { return a.score < b.score; });

    std::vector<std::string> out;
    out.reserve(maxResults);
    for (const auto& s : scored) {
        if (out.size() >= maxResults) break;
        if (s.score > maxDistance) continue;
        if (std::find(out.begin(), out.end(), s.value) != out.end()) continue;
        out.push_back(s.value);
    }
    return out;
}

// A glob is malformed only when a `[` bracket expression is never closed.
inline bool isValidGlob(std::string_view pattern) {
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '[') continue;
        std::size_t j = i + 1;
        if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) ++j;
        if (j < pattern.size() && pattern[j] == ']') ++j; // leading ']' is literal
        while (j < pattern.size() && pattern[j] != ']') ++j;
        if (j >= pattern.size()) return false;
        i = j;
    }
    return true;
}

// Shell-style wildcard match: `*`, `?` and `[...]` (with `!` or `^` negation).
// `pattern` must satisfy isValidGlob().
inline bool globMatch(std::string_view pattern, std::string_view text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t starP = std::string_view::npos;
    std::size_t starT = 0;

    // Returns whether `ch` is in the bracket at `at`; `next` receives the index past `]`.
    auto matchBracket = [&](std::size_t at, char ch, std::size_t& next) {
        std::size_t i = at + 1;
        bool negate = false;
        if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
            negate = true;
            ++i;
        }
        bool matched = false;
        bool first = true;
        while (i < pattern.size() && (first || pattern[i] != ']')) {
            first = false;
            const char lo = pattern[i];
            char hi = lo;
            if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
                hi = pattern[i + 2];
                i += 3;
            } else {
                ++i;
            }
            if (lo <= ch && ch <= hi) matched = true;
        }
        next = i + 1;
        return matched != negate;
    };

    while (t < text.size()) {
        if (p < pattern.size()) {
            const char pc = pattern[p];
            if (pc == '*') {
                starP = p++;
                starT = t;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++t;
                continue;
            }
            if (pc == '[') {
                std::size_t next = 0;
                if (matchBracket(p, text[t], next)) {
                    p = next;
                    ++t;
                    continue;
                }
            } else if (pc == text[t]) {
                ++p;
                ++t;
                continue;
            }
        }
        if (starP == std::string_view::npos) return false;
        p = starP + 1;
        t = ++starT;
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

inline bool hasGlobChars(std::string_view s) {
    return s.find_first_of("*?[") != std::string_view::npos;
}

// Escape a literal so it can be used as an ECMAScript regular expression.
inline std::string escapeRegex(std::string_view literal) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(literal.size() * 2);
    for (const char ch : literal) {
        if (kSpecial.find(ch) != std::string_view::npos) out.push_back('\\');
        out.push_back(ch);
    }
    return out;
}

// If `pattern` denotes a finite set of literal words (`abc`, `a|b|c`, `(a|b)`, `(?:a|b)`),
// returns them in declared order. Returns std::nullopt for anything using other regex operators.
inline std::optional<std::vector<std::string>> literalChoices(std::string_view pattern) {
    if (pattern.empty()) return std::nullopt;

    auto stripGroup = [](std::string_view s) -> std::string_view {
        if (s.size() < 2 || s.front() != '(' || s.back() != ')') return s;
        std::size_t depth = 0;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\\') {
                ++i;
                continue;
            }
            if (s[i] == '(') ++depth;
            if (s[i] == ')' && --depth == 0 && i + 1 != s.size()) return s;
        }
        s = s.substr(1, s.size() - 2);
        if (s.rfind("?:", 0) == 0) s.remove_prefix(2);
        return s;
    };

    const std::string_view body = stripGroup(pattern);
    static constexpr std::string_view kMeta = R"(^$.|?*+()[]{})";

    std::vector<std::string> out;
    std::string current;
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char ch = body[i];
        if (ch == '\\') {
            if (i + 1 >= body.size()) return std::nullopt;
            const char esc = body[++i];
            if (std::isalnum(static_cast<unsigned char>(esc))) return std::nullopt; // \d, \w, \s ...
            current.push_back(esc);
            continue;
        }
        if (ch == '|') {
            if (current.empty()) return std::nullopt;
            out.push_back(std::move(current));
            current.clear();
            continue;
        }
        if (kMeta.find(ch) != std::string_view::npos) return std::nullopt;
        current.push_back(ch);
    }
    if (current.empty()) return std::nullopt;
    out.push_back(std::move(current));
    return out;
}

struct Token {
    std::size_t begin{0};
    std::size_t end{0};
    std::string text;
};

// Split on whitespace, keeping exact character offsets. A token that begins with a quote
// runs to the matching unescaped closing quote, so quoted text may contain spaces.
inline std::vector<Token> tokenize(std::string_view input) {
    std::vector<Token> out;
    std::size_t i = 0;
    const auto isWs = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (i < input.size()) {
        while (i < input.size() && isWs(input[i])) ++i;
        if (i >= input.size()) break;
        const std::size_t begin = i;
        if (input[i] == '"' || input[i] == '\'') {
            const char quote = input[i++];
            while (i < input.size() && input[i] != quote) {
                if (input[i] == '\\' && i + 1 < input.size()) ++i;
                ++i;
            }
            if (i < input.size()) ++i; // closing quote
        }
        while (i < input.size() && !isWs(input[i])) ++i;
        out.push_back({begin, i, std::string(input.substr(begin, i - begin))});
    }
    return out;
}

} // namespace cmdtree::utils

#endif // CMDTREE_UTILS_HPP
