#ifndef PATH_GUARD_H
#define PATH_GUARD_H

#include <bits/stdc++.h>
#include "../common/common.h"
using namespace std;

// Subdirectories of the managed temp tree
const vector<string> MANAGED_CATEGORIES = {"sources", "execute", "inputs", "outputs", "tests", "gdb"};

// Maximum length of a sanitized identifier
const size_t MAX_SAFE_NAME_LENGTH = 64;

enum class CommandKind {
    Artifact,       // a path to a binary that must live under a managed root
    SingleBinary    // a program name or path run with fixed arguments, no shell syntax allowed
};

class PathGuard {
private:
    filesystem::path root;
    vector<filesystem::path> allowed_roots;

    bool is_under_managed_root(const filesystem::path& canonical_path) const;

public:
    // Creates the managed temp tree (root and every category directory)
    PathGuard(const string& temp_dir, const vector<string>& extra_roots = {});

    const filesystem::path& temp_root() const { return root; }

    // Throws InvalidNameError when nothing safe is left of the input
    string sanitize_filename(const string& name) const;

    // <root>/<category>/[<prefix>_]<random id><suffix>, never an existing path.
    // The prefix goes through sanitize_filename.
    filesystem::path secure_temp_path(const string& category, const string& suffix = "", const string& prefix = "") const;

    // On rejection, reason (when given) receives a human-readable explanation
    bool validate_command(const string& subject, CommandKind kind = CommandKind::Artifact, string* reason = nullptr) const;

    // Absolute, normalized form of an artifact path (relative paths live under the temp root)
    filesystem::path resolve_artifact(const string& subject) const;

    // 32 hex characters from a per-thread random generator
    static string generate_token();
};

#endif // PATH_GUARD_H
