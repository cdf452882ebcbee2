#include "prereq/AtomicClassifier.hpp"
#include "prereq/CourseCode.hpp"
#include "prereq/TextUtil.hpp"

#include <regex>
#include <vector>

namespace prereq {

bool AtomicClassifier::strip_concurrent_modifier(std::string& text) {
    static const std::regex re(R"(\(\s*or\s+concurrent\s*\))", std::regex::icase);
    std::smatch m;
    if (!std::regex_search(text, m, re)) return false;

    const std::string before = textutil::trim(m.prefix().str());
    const std::string after = textutil::trim(m.suffix().str());
    text = (before.empty() || after.empty()) ? before + after : before + " " + after;
    return true;
}

ConditionCategory AtomicClassifier::categorize(const std::string& text) {
    struct Cat {
        ConditionCategory category;
        std::vector<const char*> phrases;
    };

    // order matters: earlier categories win
    static const std::vector<Cat> cats = {
        {ConditionCategory::Standing, {
            "senior standing",
            "junior standing",
            "sophomore standing",
            "freshman standing",
            "standing",
        }},
        {ConditionCategory::Approval, {
            "instructor approval",
            "consent of instructor",
            "approval",
            "permission",
            "instructor consent",
        }},
        {ConditionCategory::Exemption, {
            "exemption",
        }},
        {ConditionCategory::Preparation, {
            "preparation course",
            "college level",
        }},
    };

    const std::string lc = textutil::to_lower_ascii(text);
    for (const auto& cat : cats) {
        for (const char* phrase : cat.phrases) {
            if (lc.find(phrase) != std::string::npos) return cat.category;
        }
    }
    return ConditionCategory::Other;
}

std::optional<Node> AtomicClassifier::classify(const std::string& fragment) const {
    std::string text = textutil::trim_chars(fragment, " ,.\t");
    if (text.empty()) return std::nullopt;

    const bool is_concurrent = strip_concurrent_modifier(text);

    if (auto code = first_course_code(text)) {
        return make_course(*code, is_concurrent);
    }

    if (text.empty()) return std::nullopt;

    const ConditionCategory category = categorize(text);
    if (category == ConditionCategory::Other && text.size() <= kMinOtherLength) {
        return std::nullopt;
    }
    return make_text(text, category);
}

} // namespace prereq
