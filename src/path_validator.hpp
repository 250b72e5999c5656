#pragma once
#include <optional>
#include <string>
#include <vector>

namespace fsgate {

// Denial reasons
constexpr const char* kReasonForbidden = "path is in a forbidden directory";
constexpr const char* kReasonOutsideRoots = "path is outside permitted directories";
constexpr const char* kReasonExtension = "file extension is not permitted";

enum class Verdict {
    Allowed,
    Denied,
    Invalid, // input could not be resolved to a path at all
};

struct ValidationResult {
    Verdict verdict = Verdict::Invalid;
    // Allowed: the normalized absolute path all I/O must use.
    // Denied: the subject that caused the denial (blocked root, resolved
    // path or extension). Invalid: the raw input.
    std::string path;
    std::string reason;

    bool allowed() const { return verdict == Verdict::Allowed; }

    // "<reason>: <path>", for user-facing errors
    std::string message() const;

    static ValidationResult allow(std::string path);
    static ValidationResult deny(std::string reason, std::string subject);
    static ValidationResult invalid(std::string reason, std::string input);
};

// Immutable sandbox configuration. Roots are made absolute and lexically
// normalized on construction; extensions are lowercased and stored
// without their leading dot. Throws std::invalid_argument when no
// allowed root is given or a root cannot be resolved.
class SandboxPolicy {
public:
    SandboxPolicy(const std::vector<std::string>& allowed_roots,
                  const std::vector<std::string>& blocked_roots,
                  const std::vector<std::string>& allowed_extensions,
                  bool resolve_symlinks = true);

    const std::vector<std::string>& allowed_roots() const { return allowed_roots_; }
    const std::vector<std::string>& blocked_roots() const { return blocked_roots_; }
    const std::vector<std::string>& allowed_extensions() const { return allowed_extensions_; }
    bool resolve_symlinks() const { return resolve_symlinks_; }

    // Roots used for containment checks: the lexical form of every
    // configured root plus, with symlink resolution on, its real form.
    const std::vector<std::string>& allowed_match_roots() const { return allowed_match_; }
    const std::vector<std::string>& blocked_match_roots() const { return blocked_match_; }

    bool extension_permitted(const std::string& ext) const;

private:
    std::vector<std::string> allowed_roots_;
    std::vector<std::string> blocked_roots_;
    std::vector<std::string> allowed_extensions_;
    std::vector<std::string> allowed_match_;
    std::vector<std::string> blocked_match_;
    bool resolve_symlinks_;
};

// Decides whether a client-supplied path may be touched. Never throws;
// every failure comes back as a Denied or Invalid result.
class PathValidator {
public:
    explicit PathValidator(SandboxPolicy policy);

    ValidationResult validate_path(const std::string& input) const;
    ValidationResult validate_extension(const std::string& path) const;

    // Copy of the configured allow-list, in configuration order
    std::vector<std::string> allowed_roots() const;

    const SandboxPolicy& policy() const { return policy_; }

private:
    std::optional<ValidationResult> check_containment(const std::string& resolved) const;

    SandboxPolicy policy_;
};

// Make `input` absolute against the current directory and collapse
// "." / ".." lexically. No trailing separator except for "/" itself.
// Throws std::filesystem::filesystem_error if the cwd is unavailable.
std::string normalize_absolute(const std::string& input);

// Follow symlinks through the longest existing prefix of an absolute,
// normalized path, keeping the non-existent tail. Dangling links are
// followed to their target. nullopt on a symlink loop or unreadable link.
std::optional<std::string> resolve_real_path(const std::string& absolute);

// Component-aligned containment: path == root or path starts with root + '/'.
bool path_within(const std::string& path, const std::string& root);

// Lowercase extension of the final segment without the dot; "" if none.
// A leading dot alone (".bashrc") is not an extension.
std::string extension_of(const std::string& path);

} // namespace fsgate
