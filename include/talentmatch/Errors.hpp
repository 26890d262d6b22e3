#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace talentmatch {

class MatchError : public std::runtime_error {
public:
    explicit MatchError(const std::string& what) : std::runtime_error(what) {}
};

struct ValidationIssue {
    std::string code;     // "out_of_range", "not_finite", "negative"
    std::string field;    // e.g. "skill_weight"
    std::string message;
};

// Rejected weight configuration. The store is left unchanged when this is thrown.
class ValidationError : public MatchError {
public:
    explicit ValidationError(std::vector<ValidationIssue> issues);

    const std::vector<ValidationIssue>& issues() const { return m_issues; }

private:
    std::vector<ValidationIssue> m_issues;
};

class NotFound : public MatchError {
public:
    NotFound(const std::string& kind, const std::string& id);
};

// Cross-tenant access. Reads exactly like NotFound so callers cannot probe
// for entities that live in another tenant.
class TenantMismatch : public NotFound {
public:
    TenantMismatch(const std::string& kind, const std::string& id) : NotFound(kind, id) {}
};

// Malformed configuration at startup; nothing can be scored without a valid snapshot.
class ConfigError : public MatchError {
public:
    explicit ConfigError(const std::string& what) : MatchError("config error: " + what) {}
};

}  // namespace talentmatch
