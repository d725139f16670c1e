// equivalence.cpp - Ordered relaxation rules

#include <docdiff/equivalence.h>
#include <docdiff/utf8.h>

#include <charconv>
#include <system_error>

namespace docdiff {

namespace {

std::optional<double> parse_number(std::string_view text)
{
    if (text.empty()) {
        return std::nullopt;
    }

    // from_chars accepts a leading '-' but not '+'
    bool negate = false;
    if (text.front() == '+' || text.front() == '-') {
        negate = text.front() == '-';
        text.remove_prefix(1);
        if (text.empty() || text.front() == '+' || text.front() == '-') {
            return std::nullopt;
        }
    }

    double result = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, result, std::chars_format::general);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return negate ? -result : result;
}

bool numbers_equal(const Value& left, const Value& right)
{
    // Two integers compare exactly, beyond double precision
    if (auto* l = left.get_if<int64_t>()) {
        if (auto* r = right.get_if<int64_t>()) {
            return *l == *r;
        }
    }

    auto l = coerce_number(left);
    if (!l) {
        return false;
    }
    auto r = coerce_number(right);
    return r && *l == *r;
}

} // anonymous namespace

std::string_view rule_name(Rule rule) noexcept
{
    switch (rule) {
        case Rule::ValueCase:    return "value_case";
        case Rule::NullWildcard: return "null_wildcard";
        case Rule::PathRegex:    return "path_regex";
        case Rule::PathFuzzy:    return "path_fuzzy";
        case Rule::BooleanType:  return "boolean_type";
        case Rule::NumericType:  return "numeric_type";
        case Rule::Structural:   return "structural";
    }
    return "unknown";
}

std::optional<bool> coerce_bool(const Value& val)
{
    if (auto* b = val.get_if<bool>()) {
        return *b;
    }
    if (auto* s = val.get_if<std::string>()) {
        if (equals_ignore_case(*s, "true")) return true;
        if (equals_ignore_case(*s, "false")) return false;
    }
    return std::nullopt;
}

std::optional<double> coerce_number(const Value& val)
{
    if (val.is_number()) {
        return val.as_number();
    }
    if (auto* s = val.get_if<std::string>()) {
        return parse_number(*s);
    }
    return std::nullopt;
}

std::string fold_case(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : decode_utf8(s)) {
        append_utf8(out, fold_code_point(cp));
    }
    return out;
}

bool equals_ignore_case(std::string_view a, std::string_view b)
{
    if (a == b) {
        return true;
    }
    const std::u32string l = decode_utf8(a);
    const std::u32string r = decode_utf8(b);
    if (l.size() != r.size()) {
        return false;
    }
    for (std::size_t i = 0; i < l.size(); ++i) {
        if (l[i] != r[i] && fold_code_point(l[i]) != fold_code_point(r[i])) {
            return false;
        }
    }
    return true;
}

// ============================================================
// EquivalenceEvaluator Implementation
// ============================================================

EquivalenceEvaluator::EquivalenceEvaluator(const EquivalencePolicy& policy)
    : policy_(policy)
{
}

std::optional<Rule> EquivalenceEvaluator::match(const Value& left, const Value& right, const Path& path)
{
    for (Rule rule : kRulePrecedence) {
        if (rule_admits(rule, left, right, path)) {
            return rule;
        }
    }
    return std::nullopt;
}

bool EquivalenceEvaluator::rule_admits(Rule rule, const Value& left, const Value& right, const Path& path)
{
    switch (rule) {
        case Rule::ValueCase: {
            if (!policy_.ignore_value_case) return false;
            auto* l = left.get_if<std::string>();
            auto* r = right.get_if<std::string>();
            return l && r && equals_ignore_case(*l, *r);
        }
        case Rule::NullWildcard:
            return policy_.ignore_null && (left.is_null() || right.is_null());
        case Rule::PathRegex: {
            const std::string* pattern = policy_.regex_for(path);
            if (!pattern) return false;
            return regex_cache_.both_match(left, right, *pattern).value_or(false);
        }
        case Rule::PathFuzzy:
            return policy_.is_fuzzy_path(path) &&
                   within_edit_distance(left, right, policy_.fuzzy_threshold);
        case Rule::BooleanType: {
            if (!policy_.ignore_boolean_type) return false;
            auto l = coerce_bool(left);
            auto r = coerce_bool(right);
            return l && r && *l == *r;
        }
        case Rule::NumericType:
            return policy_.ignore_numeric_type && numbers_equal(left, right);
        case Rule::Structural:
            return left == right;
    }
    return false;
}

bool equal(const Value& left, const Value& right, const Path& path, const EquivalencePolicy& policy)
{
    EquivalenceEvaluator evaluator{policy};
    return evaluator.equal(left, right, path);
}

} // namespace docdiff
