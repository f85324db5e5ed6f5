#include "Admission.h"
#include "Logger.h"

namespace Admission {

static InputSanitizer::Rule make_rule(const char* name, const char* pattern) {
    return {name, pattern, std::regex(pattern, std::regex::ECMAScript | std::regex::icase)};
}

const std::vector<InputSanitizer::Rule>& InputSanitizer::default_rules() {
    static const std::vector<Rule> rules = {
        make_rule("command_substitution", R"(\$\()"),
        make_rule("backtick_execution", R"(`[^`]+`)"),
        make_rule("command_chaining", R"(&&|\|\|)"),
        make_rule("destructive_command", R"(;.*rm)"),
        make_rule("external_fetch", R"(\bcurl\b|\bwget\b)"),
        make_rule("code_execution", R"(\beval\b|\bexec\b)"),
        make_rule("os_module", R"(import\s+os)"),
        make_rule("url_scheme", R"(https?://)"),
        make_rule("privilege_escalation", R"(\bsudo\b)"),
        make_rule("sensitive_path", R"(/etc/passwd|/etc/shadow)"),
    };
    return rules;
}

InputSanitizer::InputSanitizer(Logger& logger) : logger_(logger) {}

SanitizeResult InputSanitizer::sanitize(const std::string& input, const std::string& identity) const {
    SanitizeResult result;

    size_t start = input.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        result.reason = "Empty input";
        return result;
    }

    for (const auto& rule : default_rules()) {
        if (std::regex_search(input, rule.regex)) {
            logger_.audit(Logger::Level::Warning, "BLOCKED_INPUT", identity,
                          "Rule: " + rule.name + " Pattern: " + rule.pattern + " - Input: " + input.substr(0, 80));
            result.reason = "Invalid input detected";
            result.matched_rule = rule.name;
            return result;
        }
    }

    size_t end = input.find_last_not_of(" \t\r\n");
    result.valid = true;
    result.cleaned = input.substr(start, end - start + 1);
    return result;
}

} // namespace Admission
