#include "pathGuard.h"
#include <unistd.h>
#include <bits/stdc++.h>
using namespace std;

namespace fs = filesystem;

namespace {

// Characters that carry meaning for a shell
const string SHELL_METACHARACTERS = ";&|`$<>(){}[]!*?~'\"\\#";

bool is_safe_name_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return (uc < 128 && isalnum(uc)) || c == '_' || c == '-';
}

string trim_separators(const string& s) {
    size_t begin = s.find_first_not_of("_-");
    if (begin == string::npos) return "";
    size_t end = s.find_last_not_of("_-");
    return s.substr(begin, end - begin + 1);
}

}

// ============================================================================
// Construction
// ============================================================================

PathGuard::PathGuard(const string& temp_dir, const vector<string>& extra_roots) {
    fs::path requested = temp_dir.empty() ? fs::temp_directory_path() / "oi_runner" : fs::path(temp_dir);

    error_code ec;
    fs::create_directories(requested, ec);
    if (ec) {
        throw IoError("Cannot create temp root " + requested.string() + ": " + ec.message());
    }
    root = fs::canonical(requested, ec);
    if (ec) {
        throw IoError("Cannot resolve temp root " + requested.string() + ": " + ec.message());
    }

    for (const auto& category : MANAGED_CATEGORIES) {
        fs::create_directories(root / category, ec);
        if (ec) {
            throw IoError("Cannot create " + (root / category).string() + ": " + ec.message());
        }
    }

    allowed_roots.push_back(root);
    for (const auto& extra : extra_roots) {
        fs::path resolved = fs::canonical(extra, ec);
        if (ec) {
            log_line("PathGuard", "Skipping allowed root " + extra + ": " + ec.message(), nullptr, true);
            continue;
        }
        allowed_roots.push_back(resolved);
    }
}

// ============================================================================
// Filename sanitizing
// ============================================================================

string PathGuard::sanitize_filename(const string& name) const {
    string cleaned;
    cleaned.reserve(name.size());

    // Anything outside [A-Za-z0-9_-] (separators, dots, control bytes) becomes one '_'
    for (char c : name) {
        if (is_safe_name_char(c)) {
            cleaned += c;
        } else if (!cleaned.empty() && cleaned.back() != '_') {
            cleaned += '_';
        }
    }

    cleaned = trim_separators(cleaned);
    if (cleaned.size() > MAX_SAFE_NAME_LENGTH) {
        cleaned = trim_separators(cleaned.substr(0, MAX_SAFE_NAME_LENGTH));
    }

    if (cleaned.empty()) {
        throw InvalidNameError("File name '" + name + "' has no usable characters");
    }
    return cleaned;
}

// ============================================================================
// Temp paths
// ============================================================================

string PathGuard::generate_token() {
    thread_local mt19937_64 generator([] {
        random_device device;
        seed_seq seq{device(), device(), device(), device(),
                     static_cast<unsigned>(hash<thread::id>()(this_thread::get_id())),
                     static_cast<unsigned>(chrono::steady_clock::now().time_since_epoch().count())};
        return mt19937_64(seq);
    }());

    stringstream ss;
    ss << hex << setfill('0') << setw(16) << generator() << setw(16) << generator();
    return ss.str();
}

fs::path PathGuard::secure_temp_path(const string& category, const string& suffix, const string& prefix) const {
    string safe_category = sanitize_filename(category);
    string safe_prefix = prefix.empty() ? "" : sanitize_filename(prefix) + "_";

    if (!suffix.empty()) {
        bool valid_suffix = suffix[0] == '.' && suffix.size() <= 16 &&
            all_of(suffix.begin() + 1, suffix.end(), [](char c) { return isalnum(static_cast<unsigned char>(c)); });
        if (!valid_suffix) {
            throw InvalidNameError("Invalid file suffix '" + suffix + "'");
        }
    }

    fs::path directory = root / safe_category;
    error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw IoError("Cannot create " + directory.string() + ": " + ec.message());
    }

    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = directory / (safe_prefix + generate_token() + suffix);
        if (!fs::exists(candidate, ec) && !ec) {
            return candidate;
        }
    }
    throw IoError("Cannot find a free temp path under " + directory.string());
}

// ============================================================================
// Command validation
// ============================================================================

bool PathGuard::is_under_managed_root(const fs::path& canonical_path) const {
    for (const auto& allowed : allowed_roots) {
        auto [root_it, path_it] = mismatch(allowed.begin(), allowed.end(), canonical_path.begin(), canonical_path.end());
        if (root_it == allowed.end() && path_it != canonical_path.end()) {
            return true;
        }
    }
    return false;
}

fs::path PathGuard::resolve_artifact(const string& subject) const {
    fs::path path(subject);
    if (path.is_relative()) path = root / path;

    error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : resolved;
}

bool PathGuard::validate_command(const string& subject, CommandKind kind, string* reason) const {
    auto reject = [&](const string& why) {
        if (reason != nullptr) *reason = why;
        log_line("PathGuard", "Rejected '" + subject + "': " + why);
        return false;
    };

    if (subject.empty()) return reject("empty command");

    for (char c : subject) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) return reject("control character");
        if (isspace(uc)) return reject("whitespace (arguments are not accepted here)");
        if (SHELL_METACHARACTERS.find(c) != string::npos) {
            return reject(string("shell metacharacter '") + c + "'");
        }
    }

    fs::path path(subject);

    if (kind == CommandKind::SingleBinary) {
        for (const auto& part : path) {
            if (part == "..") return reject("parent directory reference");
        }
        return true;
    }

    error_code ec;
    fs::path resolved = fs::weakly_canonical(path.is_relative() ? root / path : path, ec);
    if (ec) return reject("cannot resolve path: " + ec.message());
    if (!is_under_managed_root(resolved)) return reject("path escapes the managed roots");
    if (!fs::is_regular_file(resolved, ec)) return reject("not a regular file");
    if (access(resolved.c_str(), X_OK) != 0) return reject("not executable");

    return true;
}
