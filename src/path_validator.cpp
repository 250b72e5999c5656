#include "path_validator.hpp"
#include "util.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace fsgate {

constexpr char kSep = static_cast<char>(fs::path::preferred_separator);
constexpr int kMaxSymlinkHops = 40;

static std::string strip_trailing_separator(std::string s) {
    while (s.size() > 1 && s.back() == kSep) {
        s.pop_back();
    }
    return s;
}

static void push_unique(std::vector<std::string>& v, const std::string& s) {
    if (std::find(v.begin(), v.end(), s) == v.end()) {
        v.push_back(s);
    }
}

// Re-append missing components (stored innermost first) and normalize.
static fs::path join_tail(fs::path base, const std::vector<fs::path>& tail) {
    for (auto it = tail.rbegin(); it != tail.rend(); ++it) {
        base /= *it;
    }
    return base.lexically_normal();
}

static bool has_parent_ref(const std::vector<fs::path>& tail) {
    return std::any_of(tail.begin(), tail.end(),
                       [](const fs::path& p) { return p == ".."; });
}

static std::string normalize_extension(const std::string& ext) {
    std::string e = to_lower(trim(ext));
    if (!e.empty() && e[0] == '.') e.erase(0, 1);
    return e;
}

// ── ValidationResult ─────────────────────────────────────────────

std::string ValidationResult::message() const {
    if (path.empty()) return reason;
    return reason + ": " + path;
}

ValidationResult ValidationResult::allow(std::string path) {
    return ValidationResult{Verdict::Allowed, std::move(path), {}};
}

ValidationResult ValidationResult::deny(std::string reason, std::string subject) {
    return ValidationResult{Verdict::Denied, std::move(subject), std::move(reason)};
}

ValidationResult ValidationResult::invalid(std::string reason, std::string input) {
    return ValidationResult{Verdict::Invalid, std::move(input), std::move(reason)};
}

// ── Path helpers ─────────────────────────────────────────────────

std::string normalize_absolute(const std::string& input) {
    fs::path p = fs::absolute(fs::path(input)).lexically_normal();
    return strip_trailing_separator(p.string());
}

std::optional<std::string> resolve_real_path(const std::string& absolute) {
    fs::path current(absolute);
    std::vector<fs::path> tail; // missing components, innermost first
    int hops = 0;

    while (true) {
        std::error_code ec;
        fs::path canon = fs::canonical(current, ec);
        if (!ec) {
            fs::path joined = join_tail(canon, tail);
            if (has_parent_ref(tail)) {
                // The ".." collapsed a missing directory; what it lands on
                // may itself be a link, so resolve the collapsed form again.
                if (++hops > kMaxSymlinkHops) return std::nullopt;
                current = joined;
                tail.clear();
                continue;
            }
            return strip_trailing_separator(joined.string());
        }

        // A dangling link must be followed, or a write through it would
        // land wherever it points.
        std::error_code st_ec;
        fs::file_status st = fs::symlink_status(current, st_ec);
        if (!st_ec && fs::is_symlink(st)) {
            if (++hops > kMaxSymlinkHops) return std::nullopt;
            std::error_code link_ec;
            fs::path target = fs::read_symlink(current, link_ec);
            if (link_ec) return std::nullopt;
            if (target.is_relative()) {
                std::error_code parent_ec;
                fs::path base = fs::canonical(current.parent_path(), parent_ec);
                if (parent_ec) base = current.parent_path();
                target = base / target;
            }
            // ".." in a target applies after the links before it are
            // followed; canonical() and the parent walk below do that.
            current = target;
            continue;
        }

        if (!current.has_relative_path()) {
            // Nothing under the root exists; the lexical form is the real one.
            fs::path joined = join_tail(current, tail);
            if (has_parent_ref(tail)) {
                if (++hops > kMaxSymlinkHops) return std::nullopt;
                current = joined;
                tail.clear();
                continue;
            }
            return strip_trailing_separator(joined.string());
        }
        tail.push_back(current.filename());
        current = current.parent_path();
    }
}

bool path_within(const std::string& path, const std::string& root) {
    if (root.empty()) return false;
    if (path == root) return true;
    if (path.size() <= root.size()) return false;
    if (path.compare(0, root.size(), root) != 0) return false;
    // The filesystem root already ends with a separator.
    return root.back() == kSep || path[root.size()] == kSep;
}

std::string extension_of(const std::string& path) {
    auto slash = path.find_last_of(kSep);
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return {};
    return to_lower(name.substr(dot + 1));
}

// ── SandboxPolicy ────────────────────────────────────────────────

SandboxPolicy::SandboxPolicy(const std::vector<std::string>& allowed_roots,
                             const std::vector<std::string>& blocked_roots,
                             const std::vector<std::string>& allowed_extensions,
                             bool resolve_symlinks)
    : resolve_symlinks_(resolve_symlinks) {
    auto add_root = [this](const std::string& raw,
                           std::vector<std::string>& configured,
                           std::vector<std::string>& match) {
        std::string root = trim(raw);
        if (root.empty()) return;
        if (root.find('\0') != std::string::npos) {
            throw std::invalid_argument("Sandbox root contains a NUL byte");
        }
        std::string lexical = normalize_absolute(root);
        push_unique(configured, lexical);
        push_unique(match, lexical);
        if (resolve_symlinks_) {
            auto real = resolve_real_path(lexical);
            if (!real) {
                throw std::invalid_argument("Cannot resolve sandbox root: " + lexical);
            }
            push_unique(match, *real);
        }
    };

    for (const auto& r : allowed_roots) add_root(r, allowed_roots_, allowed_match_);
    for (const auto& r : blocked_roots) add_root(r, blocked_roots_, blocked_match_);

    if (allowed_roots_.empty()) {
        throw std::invalid_argument("Sandbox policy needs at least one allowed root");
    }

    for (const auto& ext : allowed_extensions) {
        std::string e = normalize_extension(ext);
        if (!e.empty()) push_unique(allowed_extensions_, e);
    }
}

bool SandboxPolicy::extension_permitted(const std::string& ext) const {
    if (ext.empty() || allowed_extensions_.empty()) return true;
    return std::find(allowed_extensions_.begin(), allowed_extensions_.end(),
                     normalize_extension(ext)) != allowed_extensions_.end();
}

// ── PathValidator ────────────────────────────────────────────────

PathValidator::PathValidator(SandboxPolicy policy)
    : policy_(std::move(policy)) {}

std::optional<ValidationResult>
PathValidator::check_containment(const std::string& resolved) const {
    // Deny-list first: a blocked root wins even inside an allowed one.
    for (const auto& blocked : policy_.blocked_match_roots()) {
        if (path_within(resolved, blocked)) {
            return ValidationResult::deny(kReasonForbidden, blocked);
        }
    }

    const auto& allowed = policy_.allowed_match_roots();
    bool inside = std::any_of(allowed.begin(), allowed.end(),
        [&resolved](const std::string& root) { return path_within(resolved, root); });
    if (!inside) {
        return ValidationResult::deny(kReasonOutsideRoots, resolved);
    }
    return std::nullopt;
}

ValidationResult PathValidator::validate_path(const std::string& input) const {
    if (input.empty()) {
        return ValidationResult::invalid("path is empty", input);
    }
    if (input.find('\0') != std::string::npos) {
        return ValidationResult::invalid("path contains a NUL byte",
                                         input.substr(0, input.find('\0')));
    }

    std::string resolved;
    try {
        resolved = normalize_absolute(input);
    } catch (const std::exception& e) {
        return ValidationResult::invalid(std::string("invalid path (") + e.what() + ")", input);
    }

    if (auto denied = check_containment(resolved)) return *denied;

    if (!policy_.resolve_symlinks()) {
        return ValidationResult::allow(resolved);
    }

    auto real = resolve_real_path(resolved);
    if (!real) {
        return ValidationResult::invalid("cannot resolve symbolic links", resolved);
    }
    if (*real != resolved) {
        if (auto denied = check_containment(*real)) return *denied;
    }
    return ValidationResult::allow(*real);
}

ValidationResult PathValidator::validate_extension(const std::string& path) const {
    std::string ext = extension_of(path);
    if (policy_.extension_permitted(ext)) {
        return ValidationResult::allow(path);
    }
    return ValidationResult::deny(kReasonExtension, "." + ext);
}

std::vector<std::string> PathValidator::allowed_roots() const {
    return policy_.allowed_roots();
}

} // namespace fsgate
