// policy.cpp - Policy validation and JSON policy files

#include <docdiff/policy.h>
#include <docdiff/builders.h>
#include <docdiff/matchers.h>
#include <docdiff/serialization.h>

#include <limits>
#include <stdexcept>

namespace docdiff {

namespace {

bool read_bool(const Value& val, const std::string& key)
{
    if (auto* b = val.get_if<bool>()) {
        return *b;
    }
    throw std::invalid_argument("policy: '" + key + "' must be a boolean, got " +
                                std::string{kind_name(val.kind())});
}

int64_t read_integer(const Value& val, const std::string& key)
{
    if (auto* i = val.get_if<int64_t>()) {
        return *i;
    }
    throw std::invalid_argument("policy: '" + key + "' must be an integer, got " +
                                value_to_string(val));
}

void read_regex_rules(const Value& val, EquivalencePolicy& policy)
{
    auto* rules = val.get_if<ValueMap>();
    if (!rules) {
        throw std::invalid_argument("policy: 'regex' must be an object of path -> pattern");
    }
    for (const auto& [path, box] : *rules) {
        auto* pattern = box.get().get_if<std::string>();
        if (!pattern) {
            throw std::invalid_argument("policy: regex pattern for '" + path + "' must be a string");
        }
        policy.regex_by_path[path] = *pattern;
    }
}

void read_fuzzy_paths(const Value& val, EquivalencePolicy& policy)
{
    auto* paths = val.get_if<ValueVector>();
    if (!paths) {
        throw std::invalid_argument("policy: 'fuzzy_paths' must be an array of paths");
    }
    for (const auto& box : *paths) {
        auto* path = box.get().get_if<std::string>();
        if (!path) {
            throw std::invalid_argument("policy: 'fuzzy_paths' entries must be strings");
        }
        policy.fuzzy_paths.insert(*path);
    }
}

} // anonymous namespace

void require_valid(const EquivalencePolicy& policy)
{
    if (policy.fuzzy_threshold < 0) {
        throw std::invalid_argument("policy: fuzzy_threshold must be non-negative, got " +
                                    std::to_string(policy.fuzzy_threshold));
    }
    if (policy.max_depth == 0) {
        throw std::invalid_argument("policy: max_depth must be at least 1");
    }
}

std::vector<Path> validate(const EquivalencePolicy& policy)
{
    require_valid(policy);

    std::vector<Path> invalid;
    for (const auto& [path, pattern] : policy.regex_by_path) {
        if (!compile_pattern(pattern)) {
            detail::log_warning("validate", "regex for '" + path + "' does not compile: " + pattern);
            invalid.push_back(path);
        }
    }
    return invalid;
}

std::pair<Path, std::string> parse_regex_rule(std::string_view rule)
{
    const auto colon = rule.find(':');
    if (colon == std::string_view::npos) {
        throw std::invalid_argument("invalid regex match format '" + std::string{rule} +
                                    "', expected key:pattern");
    }
    if (colon == 0) {
        throw std::invalid_argument("invalid regex match format '" + std::string{rule} +
                                    "', key is empty");
    }
    return {Path{rule.substr(0, colon)}, std::string{rule.substr(colon + 1)}};
}

EquivalencePolicy policy_from_value(const Value& config)
{
    auto* entries = config.get_if<ValueMap>();
    if (!entries) {
        throw std::invalid_argument("policy: top-level value must be an object");
    }

    EquivalencePolicy policy;
    for (const auto& [key, box] : *entries) {
        const Value& val = box.get();
        if (key == "ignore_key_case") {
            policy.ignore_key_case = read_bool(val, key);
        } else if (key == "ignore_value_case") {
            policy.ignore_value_case = read_bool(val, key);
        } else if (key == "ignore_numeric_type") {
            policy.ignore_numeric_type = read_bool(val, key);
        } else if (key == "ignore_boolean_type") {
            policy.ignore_boolean_type = read_bool(val, key);
        } else if (key == "ignore_null") {
            policy.ignore_null = read_bool(val, key);
        } else if (key == "structure_only") {
            policy.structure_only = read_bool(val, key);
        } else if (key == "regex") {
            read_regex_rules(val, policy);
        } else if (key == "fuzzy_paths") {
            read_fuzzy_paths(val, policy);
        } else if (key == "fuzzy_threshold") {
            const int64_t threshold = read_integer(val, key);
            if (threshold < 0 || threshold > std::numeric_limits<int>::max()) {
                throw std::invalid_argument("policy: fuzzy_threshold out of range: " +
                                            std::to_string(threshold));
            }
            policy.fuzzy_threshold = static_cast<int>(threshold);
        } else if (key == "max_depth") {
            const int64_t depth = read_integer(val, key);
            if (depth <= 0) {
                throw std::invalid_argument("policy: max_depth must be positive, got " +
                                            std::to_string(depth));
            }
            policy.max_depth = static_cast<std::size_t>(depth);
        } else {
            throw std::invalid_argument("policy: unknown key '" + key + "'");
        }
    }

    require_valid(policy);
    return policy;
}

EquivalencePolicy load_policy_file(const std::string& file_path)
{
    return policy_from_value(read_json_file(file_path));
}

Value policy_to_value(const EquivalencePolicy& policy)
{
    MapBuilder regex;
    for (const auto& [path, pattern] : policy.regex_by_path) {
        regex.set(path, pattern);
    }

    VectorBuilder fuzzy;
    for (const auto& path : policy.fuzzy_paths) {
        fuzzy.push_back(path);
    }

    return MapBuilder()
        .set("ignore_key_case", policy.ignore_key_case)
        .set("ignore_value_case", policy.ignore_value_case)
        .set("ignore_numeric_type", policy.ignore_numeric_type)
        .set("ignore_boolean_type", policy.ignore_boolean_type)
        .set("ignore_null", policy.ignore_null)
        .set("structure_only", policy.structure_only)
        .set("regex", regex.finish())
        .set("fuzzy_paths", fuzzy.finish())
        .set("fuzzy_threshold", policy.fuzzy_threshold)
        .set("max_depth", static_cast<int64_t>(policy.max_depth))
        .finish();
}

} // namespace docdiff
