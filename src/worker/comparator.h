#ifndef COMPARATOR_H
#define COMPARATOR_H

#include <bits/stdc++.h>
#include "../common/common.h"
using namespace std;

// Line-by-line diff of program output against the expected answer.
//
// ignore_whitespace collapses every whitespace run, newlines included, into a
// single space BEFORE the text is split into lines, so both sides end up as one
// line and a mismatch anywhere is reported as a difference on line 1.
// ignore_case lower-cases ASCII letters on both sides.
// Both sides are stripped of leading/trailing whitespace, split on '\n' and
// compared index by index; the shorter side is padded with empty lines.
ComparisonResult compare_outputs(const string& actual, const string& expected,
                                 bool ignore_whitespace = true, bool ignore_case = false);

string collapse_whitespace(const string& text);
string strip_whitespace(const string& text);
vector<string> split_lines(const string& text);

#endif // COMPARATOR_H
