// matchers.cpp - Edit distance and regex predicates

#include <docdiff/matchers.h>
#include <docdiff/utf8.h>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace docdiff {

std::size_t edit_distance(std::string_view a, std::string_view b)
{
    if (a == b) {
        return 0;
    }

    std::u32string s = decode_utf8(a);
    std::u32string t = decode_utf8(b);

    // Keep the shorter string in the row to bound memory by min(|s|, |t|)
    if (s.size() < t.size()) {
        std::swap(s, t);
    }
    if (t.empty()) {
        return s.size();
    }

    std::vector<std::size_t> row(t.size() + 1);
    std::iota(row.begin(), row.end(), std::size_t{0});

    for (std::size_t i = 1; i <= s.size(); ++i) {
        std::size_t diagonal = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= t.size(); ++j) {
            const std::size_t above = row[j];
            const std::size_t cost = (s[i - 1] == t[j - 1]) ? 0 : 1;
            row[j] = std::min({above + 1, row[j - 1] + 1, diagonal + cost});
            diagonal = above;
        }
    }
    return row[t.size()];
}

bool within_edit_distance(const Value& a, const Value& b, int threshold)
{
    auto* sa = a.get_if<std::string>();
    auto* sb = b.get_if<std::string>();
    if (!sa || !sb || threshold < 0) {
        return false;
    }
    return edit_distance(*sa, *sb) <= static_cast<std::size_t>(threshold);
}

std::optional<boost::regex> compile_pattern(const std::string& pattern)
{
    try {
        return boost::regex{pattern, boost::regex::ECMAScript};
    } catch (const boost::regex_error&) {
        return std::nullopt;
    }
}

std::optional<bool> regex_matches(const boost::regex& re, std::string_view text)
{
    try {
        return boost::regex_search(text.begin(), text.end(), re);
    } catch (const std::runtime_error&) {
        // Complexity or memory limit reached
        return std::nullopt;
    }
}

const boost::regex* RegexCache::find_or_compile(const std::string& pattern)
{
    auto it = compiled_.find(pattern);
    if (it == compiled_.end()) {
        it = compiled_.emplace(pattern, compile_pattern(pattern)).first;
    }
    const auto& slot = it->second;
    return slot ? &*slot : nullptr;
}

std::optional<bool> RegexCache::both_match(const Value& a, const Value& b, const std::string& pattern)
{
    auto* sa = a.get_if<std::string>();
    auto* sb = b.get_if<std::string>();
    if (!sa || !sb) {
        return std::nullopt;
    }

    const boost::regex* re = find_or_compile(pattern);
    if (!re) {
        return std::nullopt;
    }
    auto left = regex_matches(*re, *sa);
    if (!left || !*left) {
        return left;
    }
    return regex_matches(*re, *sb);
}

} // namespace docdiff
