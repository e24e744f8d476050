#ifndef CMDTREE_VALUE_HPP
#define CMDTREE_VALUE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace cmdtree {

// Typed result of a Variable's parse hook. Tuple-like values (IPv4 octets, hostname labels)
// are stored as vectors.
using VarValue = std::variant<bool, std::int64_t, double, std::string, std::vector<std::int64_t>, std::vector<std::string>>;

// Parse/candidate hooks for a Variable node.
//
// Notes:
// - `pattern()` is the default regular expression a token must fully match before `parse()` runs.
// - `parse()` returns an error string on failure; empty optional indicates success.
// - `candidates()` offers completions for a partial token; most types have none.
class VariableType {
public:
    virtual ~VariableType() = default;

    // A human-readable type name (e.g. "integer", "ip").
    [[nodiscard]] virtual std::string type() const = 0;
    [[nodiscard]] virtual std::string pattern() const = 0;
    [[nodiscard]] virtual std::optional<std::string> parse(std::string_view token, VarValue& out) const = 0;
    [[nodiscard]] virtual std::vector<std::string> candidates(std::string_view partial) const {
        (void)partial;
        return {};
    }
};

using VariableTypePtr = std::shared_ptr<const VariableType>;
using ParseFunc = std::function<std::optional<std::string>(std::string_view token, VarValue& out)>;

namespace types {

VariableTypePtr text();     // any non-blank token, stored as string
VariableTypePtr word();     // identifier-like word
VariableTypePtr string();   // bare word or quoted string, unescaped
VariableTypePtr integer();  // std::int64_t
VariableTypePtr floating(); // double
VariableTypePtr boolean();  // true/yes/on/1 ... false/no/off/0
VariableTypePtr ip();       // IPv4, four octets as std::vector<std::int64_t>
VariableTypePtr hostname(); // labels as std::vector<std::string>
VariableTypePtr host();     // ip() or hostname()
VariableTypePtr email();
VariableTypePtr uri();
VariableTypePtr ldapDn();

struct FileOptions {
    std::vector<std::string> includes{"*"};
    std::vector<std::string> excludes;
    bool allowDotfiles{false};
    bool allowDirectories{false};
};
VariableTypePtr file(FileOptions options = {});

// A type built from a pattern and a parse hook. A null hook stores the token as a string.
VariableTypePtr custom(std::string name, std::string pattern, ParseFunc parse = {});

// Built-in type by its `type()` name; nullptr when unknown.
VariableTypePtr byName(std::string_view name);

} // namespace types

// Variables collected during one parse run, keyed by variable name.
// A variable whose node allows repeats is always a sequence, even with one element.
class Variables {
public:
    struct Entry {
        std::vector<VarValue> values;
        bool sequence{false};

        bool operator==(const Entry& other) const { return sequence == other.sequence && values == other.values; }
    };

    void store(const std::string& name, VarValue value, bool sequence) {
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            order_.push_back(name);
            it = entries_.emplace(name, Entry{}).first;
        }
        it->second.sequence = sequence;
        if (!sequence) it->second.values.clear();
        it->second.values.push_back(std::move(value));
    }

    [[nodiscard]] bool has(const std::string& name) const { return entries_.find(name) != entries_.end(); }

    [[nodiscard]] const Entry* find(const std::string& name) const {
        const auto it = entries_.find(name);
        return it == entries_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool isSequence(const std::string& name) const {
        const auto* e = find(name);
        return e != nullptr && e->sequence;
    }

    // Scalar access. For sequences the last value is returned.
    template <typename T>
    T get(const std::string& name, T defaultValue = T()) const {
        const auto* e = find(name);
        if (e == nullptr || e->values.empty()) return defaultValue;
        return convert<T>(e->values.back(), std::move(defaultValue));
    }

    template <typename T>
    std::vector<T> getAll(const std::string& name) const {
        std::vector<T> out;
        const auto* e = find(name);
        if (e == nullptr) return out;
        out.reserve(e->values.size());
        for (const auto& v : e->values) out.push_back(convert<T>(v, T()));
        return out;
    }

    // Names in first-stored order.
    [[nodiscard]] const std::vector<std::string>& names() const { return order_; }
    [[nodiscard]] std::size_t size() const { return order_.size(); }
    [[nodiscard]] bool empty() const { return order_.empty(); }

    bool operator==(const Variables& other) const { return order_ == other.order_ && entries_ == other.entries_; }
    bool operator!=(const Variables& other) const { return !(*this == other); }

private:
    template <typename T, typename Variant>
    struct IsAlternative;

    template <typename T, typename... Ts>
    struct IsAlternative<T, std::variant<Ts...>> : std::disjunction<std::is_same<T, Ts>...> {};

    template <typename T>
    static T convert(const VarValue& v, T defaultValue) {
        if constexpr (IsAlternative<T, VarValue>::value) {
            if (const auto* exact = std::get_if<T>(&v)) return *exact;
        }
        if constexpr (std::is_arithmetic_v<T>) {
            if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<T>(*i);
            if (const auto* d = std::get_if<double>(&v)) return static_cast<T>(*d);
            if (const auto* b = std::get_if<bool>(&v)) return static_cast<T>(*b);
        }
        return defaultValue;
    }

    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> order_;
};

// Human-readable rendering used in diagnostics and examples.
std::string toString(const VarValue& value);

} // namespace cmdtree

#endif // CMDTREE_VALUE_HPP
