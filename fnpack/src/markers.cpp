#include "markers.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <vector>

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

std::vector<int> version_parts(std::string_view version) {
    std::vector<int> parts;
    size_t start = 0;
    while (start <= version.size()) {
        size_t end = version.find('.', start);
        if (end == std::string_view::npos) end = version.size();
        // leading digits only: "0rc1" counts as 0
        int value = 0;
        for (size_t i = start; i < end && std::isdigit(static_cast<unsigned char>(version[i])); ++i) {
            value = value * 10 + (version[i] - '0');
        }
        parts.push_back(value);
        start = end + 1;
    }
    return parts;
}

bool is_version_variable(std::string_view name) {
    return name == "python_version" || name == "python_full_version" || name == "implementation_version";
}

struct Operand {
    std::string value;
    std::string variable;  // empty for a quoted literal
};

class MarkerParser {
public:
    MarkerParser(std::string_view text, const MarkerEnvironment& env) : text_(text), env_(env) {}

    bool parse() {
        const bool value = parse_or();
        skip_space();
        if (pos_ != text_.size()) fail();
        return value;
    }

private:
    // Both sides are always parsed so the whole marker is validated.
    bool parse_or() {
        bool value = parse_and();
        while (consume_keyword("or")) {
            const bool rhs = parse_and();
            value = value || rhs;
        }
        return value;
    }

    bool parse_and() {
        bool value = parse_atom();
        while (consume_keyword("and")) {
            const bool rhs = parse_atom();
            value = value && rhs;
        }
        return value;
    }

    bool parse_atom() {
        skip_space();
        if (consume("(")) {
            const bool value = parse_or();
            skip_space();
            if (!consume(")")) fail();
            return value;
        }
        const Operand lhs = parse_operand();
        const std::string op = parse_operator();
        const Operand rhs = parse_operand();
        return apply(lhs, op, rhs);
    }

    Operand parse_operand() {
        skip_space();
        if (pos_ >= text_.size()) fail();

        const char quote = text_[pos_];
        if (quote == '"' || quote == '\'') {
            const size_t close = text_.find(quote, pos_ + 1);
            if (close == std::string_view::npos) fail();
            Operand literal{std::string(text_.substr(pos_ + 1, close - pos_ - 1)), ""};
            pos_ = close + 1;
            return literal;
        }

        const size_t start = pos_;
        while (pos_ < text_.size() && is_name_char(text_[pos_])) ++pos_;
        if (pos_ == start) fail();
        std::string name(text_.substr(start, pos_ - start));
        return Operand{lookup(name), name};
    }

    std::string parse_operator() {
        skip_space();
        for (std::string_view op : {"===", "==", "!=", "~=", "<=", ">=", "<", ">"}) {
            if (consume(op)) return std::string(op);
        }
        if (consume_keyword("in")) return "in";
        if (consume_keyword("not") && consume_keyword("in")) return "not in";
        fail();
    }

    std::string lookup(const std::string& name) const {
        if (name == "python_version") return env_.python_version;
        if (name == "python_full_version" || name == "implementation_version") return env_.python_full_version;
        if (name == "sys_platform" || name == "sys.platform") return env_.sys_platform;
        if (name == "platform_system") return env_.platform_system;
        if (name == "platform_machine" || name == "platform.machine") return env_.platform_machine;
        if (name == "os_name" || name == "os.name") return env_.os_name;
        if (name == "implementation_name") return env_.implementation_name;
        if (name == "platform_python_implementation" || name == "python_implementation" ||
            name == "platform.python_implementation") {
            return env_.platform_python_implementation;
        }
        if (name == "extra") return "";
        throw FnpackException(string_format("error.invalid_marker", std::string(text_), name));
    }

    bool apply(const Operand& lhs, const std::string& op, const Operand& rhs) const {
        if (op == "in") return rhs.value.find(lhs.value) != std::string::npos;
        if (op == "not in") return rhs.value.find(lhs.value) == std::string::npos;
        if (op == "===") return lhs.value == rhs.value;

        if (is_version_variable(lhs.variable) || is_version_variable(rhs.variable)) {
            return apply_version(lhs.value, op, rhs.value);
        }
        if (op == "==") return lhs.value == rhs.value;
        if (op == "!=") return lhs.value != rhs.value;
        fail();
    }

    bool apply_version(const std::string& lhs, const std::string& op, const std::string& rhs) const {
        if ((op == "==" || op == "!=") && rhs.ends_with(".*")) {
            // prefix match: python_version == "3.*"
            const auto want = version_parts(std::string_view(rhs).substr(0, rhs.size() - 2));
            auto have = version_parts(lhs);
            have.resize(std::max(have.size(), want.size()), 0);
            const bool matches = std::equal(want.begin(), want.end(), have.begin());
            return op == "==" ? matches : !matches;
        }

        const int cmp = compare_versions(lhs, rhs);
        if (op == "==") return cmp == 0;
        if (op == "!=") return cmp != 0;
        if (op == "<") return cmp < 0;
        if (op == "<=") return cmp <= 0;
        if (op == ">") return cmp > 0;
        if (op == ">=") return cmp >= 0;
        // "~=": at least rhs, and the same release series
        auto prefix = version_parts(rhs);
        if (prefix.size() < 2) fail();
        prefix.pop_back();
        auto have = version_parts(lhs);
        have.resize(std::max(have.size(), prefix.size()), 0);
        return cmp >= 0 && std::equal(prefix.begin(), prefix.end(), have.begin());
    }

    void skip_space() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    bool consume(std::string_view token) {
        if (text_.substr(pos_).starts_with(token)) {
            pos_ += token.size();
            return true;
        }
        return false;
    }

    bool consume_keyword(std::string_view keyword) {
        skip_space();
        const size_t end = pos_ + keyword.size();
        if (!text_.substr(pos_).starts_with(keyword) || (end < text_.size() && is_name_char(text_[end]))) {
            return false;
        }
        pos_ = end;
        return true;
    }

    [[noreturn]] void fail() const {
        throw FnpackException(string_format("error.invalid_marker", std::string(text_), pos_));
    }

    std::string_view text_;
    const MarkerEnvironment& env_;
    size_t pos_ = 0;
};

} // anonymous namespace

MarkerEnvironment marker_environment_for_runtime(const std::string& runtime) {
    static const std::regex runtime_regex(R"(^python(\d)\.(\d+)$)");
    std::smatch match;
    if (!std::regex_match(runtime, match, runtime_regex)) {
        throw FnpackException(string_format("error.unsupported_runtime", runtime));
    }

    MarkerEnvironment env;
    env.python_version = match[1].str() + "." + match[2].str();
    env.python_full_version = env.python_version + ".0";
    return env;
}

bool evaluate_marker(std::string_view marker, const MarkerEnvironment& env) {
    return MarkerParser(marker, env).parse();
}

int compare_versions(std::string_view a, std::string_view b) {
    auto lhs = version_parts(a);
    auto rhs = version_parts(b);
    const size_t len = std::max(lhs.size(), rhs.size());
    lhs.resize(len, 0);
    rhs.resize(len, 0);
    for (size_t i = 0; i < len; ++i) {
        if (lhs[i] != rhs[i]) return lhs[i] < rhs[i] ? -1 : 1;
    }
    return 0;
}
