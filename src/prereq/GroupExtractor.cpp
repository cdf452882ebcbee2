#include "prereq/GroupExtractor.hpp"
#include "prereq/AtomicClassifier.hpp"
#include "prereq/TextUtil.hpp"

#include <regex>
#include <utility>

namespace prereq {

std::string placeholder_token(std::size_t index) {
    return "{{group:" + std::to_string(index) + "}}";
}

static std::size_t matching_close(const std::string& text, std::size_t open) {
    int depth = 0;
    for (std::size_t i = open; i < text.size(); ++i) {
        if (text[i] == '(') ++depth;
        else if (text[i] == ')') {
            if (--depth == 0) return i;
        }
    }
    return std::string::npos;
}

static bool is_concurrent_modifier(const std::string& inner) {
    static const std::regex re(R"(^\s*or\s+concurrent\s*$)", std::regex::icase);
    return std::regex_match(inner, re);
}

GroupExtraction extract_groups(const std::string& text) {
    GroupExtraction out;
    std::string buf;
    buf.reserve(text.size() + 16);

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '(') {
            const std::size_t close = matching_close(text, i);
            if (close != std::string::npos) {
                const std::string inner = text.substr(i + 1, close - i - 1);
                if (is_concurrent_modifier(inner)) {
                    buf += text.substr(i, close - i + 1);
                } else {
                    buf += " " + placeholder_token(out.groups.size()) + " ";
                    out.groups.push_back(inner);
                }
                i = close + 1;
                continue;
            }
        }
        buf.push_back(text[i]);
        ++i;
    }

    out.text = textutil::collapse_whitespace(buf);
    return out;
}

static std::optional<std::size_t> token_index(const std::string& leaf, std::size_t group_count) {
    // bounded so stoul cannot overflow on a literal "{{group:...}}" in the text
    static const std::regex re(R"(^\{\{group:(\d{1,9})\}\}$)");
    std::smatch m;
    if (!std::regex_match(leaf, m, re)) return std::nullopt;
    const std::size_t idx = std::stoul(m[1].str());
    if (idx >= group_count) return std::nullopt;
    return idx;
}

// put "(content)" back for tokens embedded in a longer text fragment
static std::string restore_tokens(std::string text, const GroupExtraction& ex) {
    for (std::size_t i = 0; i < ex.groups.size(); ++i) {
        const std::string tok = placeholder_token(i);
        std::size_t pos = 0;
        while ((pos = text.find(tok, pos)) != std::string::npos) {
            const std::string repl = "(" + ex.groups[i] + ")";
            text.replace(pos, tok.size(), repl);
            pos += repl.size();
        }
    }
    return text;
}

namespace {

struct Reinserter {
    const GroupExtraction& ex;
    const InnerParser& parse_inner;

    std::optional<Node> walk(Node node) {
        return std::visit(*this, std::move(node.value));
    }

    std::vector<Node> walk_children(std::vector<Node> kids) {
        std::vector<Node> out;
        out.reserve(kids.size());
        for (auto& k : kids) {
            if (auto n = walk(std::move(k))) out.push_back(std::move(*n));
        }
        return out;
    }

    // A token that shared its fragment with a course code is gone by now:
    // the classifier kept the code and dropped the rest of the fragment.
    std::optional<Node> operator()(Course&& c) { return Node{std::move(c)}; }

    std::optional<Node> operator()(And&& a) { return combine_and(walk_children(std::move(a.children))); }

    std::optional<Node> operator()(Or&& o) { return combine_or(walk_children(std::move(o.children))); }

    std::optional<Node> operator()(Group&& g) {
        if (!g.expression) return std::nullopt;
        auto inner = walk(std::move(*g.expression));
        if (!inner) return std::nullopt;
        return make_group(std::move(*inner));
    }

    std::optional<Node> operator()(Concurrent&& c) {
        if (!c.course) return std::nullopt;
        auto inner = walk(std::move(*c.course));
        if (!inner) return std::nullopt;
        return make_concurrent(std::move(*inner), std::move(c.note));
    }

    std::optional<Node> operator()(TextCondition&& t) {
        if (auto idx = token_index(t.condition, ex.groups.size())) {
            auto inner = parse_inner(ex.groups[*idx]);
            if (!inner) return std::nullopt;
            return make_group(std::move(*inner));
        }
        if (t.condition.find("{{group:") != std::string::npos) {
            t.condition = restore_tokens(std::move(t.condition), ex);
            t.category = AtomicClassifier::categorize(t.condition);
        }
        return Node{std::move(t)};
    }
};

} // namespace

std::optional<Node> reinsert_groups(Node node, const GroupExtraction& extraction, const InnerParser& parse_inner) {
    Reinserter r{extraction, parse_inner};
    return r.walk(std::move(node));
}

} // namespace prereq
