#include "comparator.h"
#include <bits/stdc++.h>
using namespace std;

// ============================================================================
// Normalization
// ============================================================================

string collapse_whitespace(const string& text) {
    stringstream ss(text);
    string word, result;
    while (ss >> word) {
        if (!result.empty()) result += ' ';
        result += word;
    }
    return result;
}

string strip_whitespace(const string& text) {
    auto is_space = [](char c) { return isspace(static_cast<unsigned char>(c)) != 0; };
    size_t begin = 0, end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

// "" gives one empty line, "a\n" gives {"a", ""}
vector<string> split_lines(const string& text) {
    vector<string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

// ============================================================================
// Compare
// ============================================================================

ComparisonResult compare_outputs(const string& actual, const string& expected, bool ignore_whitespace, bool ignore_case) {
    string lhs = actual, rhs = expected;

    if (ignore_whitespace) {
        lhs = collapse_whitespace(lhs);
        rhs = collapse_whitespace(rhs);
    }
    if (ignore_case) {
        auto lower = [](string s) {
            transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)tolower(c); });
            return s;
        };
        lhs = lower(lhs);
        rhs = lower(rhs);
    }

    vector<string> actual_lines = split_lines(strip_whitespace(lhs));
    vector<string> expected_lines = split_lines(strip_whitespace(rhs));

    ComparisonResult result;
    result.actual_line_count = (int)actual_lines.size();
    result.expected_line_count = (int)expected_lines.size();

    size_t max_lines = max(actual_lines.size(), expected_lines.size());
    for (size_t i = 0; i < max_lines; ++i) {
        string actual_line = i < actual_lines.size() ? actual_lines[i] : "";
        string expected_line = i < expected_lines.size() ? expected_lines[i] : "";
        if (actual_line != expected_line) {
            result.differences.push_back({(int)i + 1, actual_line, expected_line});
        }
    }

    result.match = result.differences.empty();
    return result;
}
