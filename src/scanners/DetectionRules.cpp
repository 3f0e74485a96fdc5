#include "DetectionRules.h"
#include "../core/Utils.h"
#include <algorithm>

namespace secret_hunter {

namespace {
    const char* kEmailPattern = R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})";
    // "password", "db_password", "\"password\"", "'PASSWORD'" then := and a quoted value
    const char* kPasswordPattern = R"([\w"']*password[\w"']*\s*[:=]\s*['"](.*?)['"])";
    const char* kApiKeyPattern = R"(api[_-]?key[\w"']*\s*[:=]\s*['"](.*?)['"])";

    bool contains_trigger(const std::string& lowered_line, const std::string& trigger) {
        return trigger.empty() || lowered_line.find(trigger) != std::string::npos;
    }
}

RuleSet RuleSet::defaults() {
    RuleSet set;
    set.add({FindingKind::Email, "email", std::regex(kEmailPattern, std::regex::ECMAScript), 0, "@"});
    set.add({FindingKind::Password, "password", std::regex(kPasswordPattern, std::regex::ECMAScript | std::regex::icase), 1, "password"});
    set.add({FindingKind::ApiKey, "api_key", std::regex(kApiKeyPattern, std::regex::ECMAScript | std::regex::icase), 1, "api"});
    return set;
}

std::vector<std::string> RuleSet::known_rule_names() {
    return {"email", "password", "api_key"};
}

void RuleSet::add(DetectionRule rule) {
    rule.trigger = utils::to_lower(rule.trigger);
    rules_.push_back(std::move(rule));
}

bool RuleSet::disable(const std::string& name) {
    auto it = std::remove_if(rules_.begin(), rules_.end(), [&](const DetectionRule& r){ return r.name == name; });
    if(it == rules_.end()) return false;
    rules_.erase(it, rules_.end());
    return true;
}

std::vector<RuleMatch> RuleSet::match_line(const std::string& line) const {
    std::vector<RuleMatch> out;
    // std::regex backtracks badly on long lines; a literal scan rules most
    // lines out before any regex runs.
    std::string lowered;
    bool have_lowered = false;
    for(const auto& rule : rules_) {
        if(!rule.trigger.empty()) {
            if(!have_lowered) {
                lowered = utils::to_lower(line);
                have_lowered = true;
            }
            if(!contains_trigger(lowered, rule.trigger)) continue;
        }
        for(std::sregex_iterator it(line.begin(), line.end(), rule.pattern), end; it != end; ++it) {
            const std::smatch& m = *it;
            out.push_back({rule.kind, m[rule.value_group].str()});
        }
    }
    return out;
}

}
