#include "talentmatch/Errors.hpp"

#include <sstream>

namespace talentmatch {

static std::string summarize(const std::vector<ValidationIssue>& issues) {
    std::ostringstream oss;
    oss << "invalid weight configuration";
    for (size_t i = 0; i < issues.size(); ++i) {
        oss << (i == 0 ? ": " : "; ") << issues[i].field << " " << issues[i].message;
    }
    return oss.str();
}

ValidationError::ValidationError(std::vector<ValidationIssue> issues)
    : MatchError(summarize(issues)), m_issues(std::move(issues)) {}

NotFound::NotFound(const std::string& kind, const std::string& id)
    : MatchError(kind + " not found: " + id) {}

}  // namespace talentmatch
