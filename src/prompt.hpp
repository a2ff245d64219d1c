#pragma once
#include <string>
#include <vector>
#include <unordered_map>

namespace sift {

struct Config;

// Placeholder substituted for empty text when only an image was submitted.
constexpr const char* kImageOnlyInput = "(see attached image)";

// System directives and per-report-type templates. Templates may use
// {{user_input}} and {{date}}; directives may use {{date}}.
class PromptSet {
public:
    PromptSet() = default;
    PromptSet(std::string system_directive, std::string chat_directive,
              std::unordered_map<std::string, std::string> templates);

    static PromptSet from_config(const Config& config);

    bool has_report_type(const std::string& report_type) const;
    std::vector<std::string> report_types() const; // sorted

    // Initial analysis directive; model_directive (if non-empty) takes precedence.
    std::string system_prompt(const std::string& model_directive = "") const;

    // Follow-up directive; override (if non-empty) replaces it.
    std::string chat_system_prompt(const std::string& override_directive = "") const;

    // Throws std::invalid_argument for an unknown report type.
    std::string render_user_prompt(const std::string& report_type,
                                   const std::string& user_input) const;

private:
    std::string system_directive_;
    std::string chat_directive_;
    std::unordered_map<std::string, std::string> templates_;
};

// Substitute {{date}} and the given variables in a template.
std::string render_template(const std::string& tmpl,
                            const std::unordered_map<std::string, std::string>& vars);

} // namespace sift
