#include "utils.hpp"
#include <platform/platform.hpp>
#include <sstream>

namespace fs = std::filesystem;

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream in(line);
    std::string tok;
    while (in >> tok) {
        tokens.push_back(tok);
    }
    return tokens;
}

fs::path expand_home(const std::string& path) {
    if (path == "~") {
        return platform::home_dir();
    }
    if (path.rfind("~/", 0) == 0) {
        return platform::home_dir() / path.substr(2);
    }
    return fs::path(path);
}

fs::path normalize_path(const fs::path& p) {
    fs::path n = p.lexically_normal();
    // "a/b/" normalizes to "a/b/" with an empty filename; drop it
    if (!n.has_filename() && n.has_relative_path()) {
        n = n.parent_path();
    }
    return n;
}

fs::path normalize_root(const fs::path& root) {
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    return normalize_path(ec ? root : abs);
}

bool is_within(const fs::path& path, const fs::path& base) {
    auto p = path.begin();
    for (auto b = base.begin(); b != base.end(); ++b, ++p) {
        if (p == path.end() || *p != *b) {
            return false;
        }
    }
    return true;
}
