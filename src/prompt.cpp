#include "prompt.hpp"
#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

namespace sift {

PromptSet::PromptSet(std::string system_directive, std::string chat_directive,
                     std::unordered_map<std::string, std::string> templates)
    : system_directive_(std::move(system_directive)),
      chat_directive_(std::move(chat_directive)),
      templates_(std::move(templates)) {}

PromptSet PromptSet::from_config(const Config& config) {
    return PromptSet(config.prompts.system_directive,
                     config.prompts.chat_directive,
                     config.prompts.templates);
}

bool PromptSet::has_report_type(const std::string& report_type) const {
    return templates_.count(report_type) > 0;
}

std::vector<std::string> PromptSet::report_types() const {
    std::vector<std::string> types;
    types.reserve(templates_.size());
    for (const auto& [type, _] : templates_) types.push_back(type);
    std::sort(types.begin(), types.end());
    return types;
}

std::string render_template(const std::string& tmpl,
                            const std::unordered_map<std::string, std::string>& vars) {
    std::string out = replace_all(tmpl, "{{date}}", date_today());
    for (const auto& [name, value] : vars) {
        out = replace_all(out, "{{" + name + "}}", value);
    }
    return out;
}

std::string PromptSet::system_prompt(const std::string& model_directive) const {
    const std::string& directive = model_directive.empty() ? system_directive_ : model_directive;
    return render_template(directive, {});
}

std::string PromptSet::chat_system_prompt(const std::string& override_directive) const {
    if (!override_directive.empty()) return override_directive;
    const std::string& directive = chat_directive_.empty() ? system_directive_ : chat_directive_;
    return render_template(directive, {});
}

std::string PromptSet::render_user_prompt(const std::string& report_type,
                                          const std::string& user_input) const {
    auto it = templates_.find(report_type);
    if (it == templates_.end()) {
        throw std::invalid_argument("Unknown report type: " + report_type);
    }
    std::string input = is_blank(user_input) ? kImageOnlyInput : user_input;
    return render_template(it->second, {{"user_input", input}});
}

} // namespace sift
