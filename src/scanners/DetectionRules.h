#pragma once
#include "../core/Finding.h"
#include <regex>
#include <string>
#include <vector>

namespace secret_hunter {

struct DetectionRule {
    FindingKind kind;
    std::string name;
    std::regex pattern;
    int value_group; // 0 = whole match
    // Lower-case literal every match contains. Lines without it skip the
    // regex entirely. Empty = always run the regex.
    std::string trigger;
};

struct RuleMatch {
    FindingKind kind;
    std::string value;
};

class RuleSet {
public:
    // email, password, api_key in that order
    static RuleSet defaults();
    static std::vector<std::string> known_rule_names();

    void add(DetectionRule rule);
    // Returns false if no rule has that name.
    bool disable(const std::string& name);

    // Every non-overlapping match of every rule, rule order first, then
    // position within the line.
    std::vector<RuleMatch> match_line(const std::string& line) const;

    const std::vector<DetectionRule>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }

private:
    std::vector<DetectionRule> rules_;
};

}
