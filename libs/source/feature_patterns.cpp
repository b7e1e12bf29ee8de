/**
 * @file feature_patterns.cpp
 * @brief Regex-based line classifiers for source feature derivation
 */

#include "feature_patterns.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace ossensor::source::patterns {

namespace {

using SvMatch = std::match_results<std::string_view::const_iterator>;

[[nodiscard]] bool search(std::string_view code, const std::regex& re)
{
    return std::regex_search(code.begin(), code.end(), re);
}

[[nodiscard]] bool is_ident_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] const std::regex& allocation_regex()
{
    static const std::regex kRegex(
        R"(\b(?:malloc|calloc|realloc|reallocf|reallocarray|valloc|alloca|xmalloc|kalloc\w*|kmalloc\w*|kzalloc|kcalloc|vmalloc|vzalloc|IOMalloc\w*|g_malloc\w*)\s*\(|\boperator\s+new(?:\[\])?\s*\()");
    return kRegex;
}

[[nodiscard]] const std::regex& array_new_regex()
{
    static const std::regex kRegex(R"(\bnew\s+[A-Za-z_][\w:]*(?:\s*<[^>]*>)?\s*\[\s*([^\]]+)\])");
    return kRegex;
}

[[nodiscard]] const std::regex& copy_regex()
{
    static const std::regex kRegex(
        R"(\b(?:memcpy|memmove|bcopy|copyin|copyout|strcpy|strncpy|strlcpy|strcat|strncat|strlcat|wmemcpy)\s*\()");
    return kRegex;
}

[[nodiscard]] const std::regex& conditional_regex()
{
    static const std::regex kRegex(R"(\b(?:if|assert|static_assert|__builtin_expect|require)\s*\()");
    return kRegex;
}

[[nodiscard]] const std::regex& bounds_helper_regex()
{
    static const std::regex kRegex(R"(\b(?:bounds_check|range_check|check_bounds|check_range)\w*\s*\()");
    return kRegex;
}

[[nodiscard]] const std::regex& overflow_regex()
{
    static const std::regex kRegex(
        R"(\b(?:__builtin_\w+_overflow|os_\w+_overflow|\w*[Oo]verflow\w*|SIZE_MAX|SSIZE_MAX|UINT32_MAX|UINT64_MAX|INT_MAX|UINT_MAX)\b)");
    return kRegex;
}

[[nodiscard]] const std::regex& byte_order_read_regex()
{
    static const std::regex kRegex(
        R"(\b(?:ntohl|ntohs|ntohll|be16toh|be32toh|be64toh|le16toh|le32toh|le64toh|OSReadBigInt\w*|OSReadLittleInt\w*|OSSwapBigToHostInt\w*|OSSwapLittleToHostInt\w*|read_u(?:8|16|32|64)\w*|read_be\w*|read_le\w*|get_u(?:16|32|64)\w*|get_be\w*|get_le\w*)\s*\()");
    return kRegex;
}

[[nodiscard]] const std::regex& pointer_cast_load_regex()
{
    static const std::regex kRegex(
        R"(\*\s*\(\s*(?:const\s+)?(?:u?int(?:8|16|32|64)_t|unsigned\s+(?:int|short|long)|uint)\s*\*\s*\))");
    return kRegex;
}

[[nodiscard]] const std::regex& scanf_regex()
{
    static const std::regex kRegex(R"(\b(?:sscanf|fscanf|scanf|vsscanf)\s*\()");
    return kRegex;
}

[[nodiscard]] const std::regex& parse_call_regex()
{
    static const std::regex kRegex(R"(\b\w*(?:parse|decode|deserialize|unpack)\w*\s*\()",
                                   std::regex::ECMAScript | std::regex::icase);
    return kRegex;
}

[[nodiscard]] const std::regex& length_field_regex()
{
    static const std::regex kRegex(R"((?:len|length|count|size|nbytes|num)\w*\b)",
                                   std::regex::ECMAScript | std::regex::icase);
    return kRegex;
}

[[nodiscard]] const std::regex& privilege_regex()
{
    static const std::regex kRegex(
        R"(\b(?:geteuid|getuid|getegid|getgid|capable|ns_capable|has_capability|priv_check\w*|suser|proc_suser|kauth_\w+|check_entitlement\w*|require_entitlement\w*|SecTaskCopyValueForEntitlement|IOTaskHasEntitlement|IOCurrentTaskHasEntitlement|csr_check|mac_\w+_check\w*)\s*\()");
    return kRegex;
}

constexpr std::array<std::string_view, 16> kNonOperandWords = {
    "sizeof", "alignof", "char",     "short",  "int",    "long",  "float", "double",
    "void",   "signed",  "unsigned", "struct", "const",  "union", "enum",  "return",
};

/// Identifier ending right before `end` (exclusive), or empty
[[nodiscard]] std::string_view identifier_before(std::string_view text, std::size_t end)
{
    std::size_t begin = end;
    while (begin > 0 && is_ident_char(text[begin - 1])) {
        --begin;
    }
    return text.substr(begin, end - begin);
}

/// Identifier starting at `begin`, or empty
[[nodiscard]] std::string_view identifier_at(std::string_view text, std::size_t begin)
{
    std::size_t end = begin;
    while (end < text.size() && is_ident_char(text[end])) {
        ++end;
    }
    return text.substr(begin, end - begin);
}

/// A variable operand: identifier that is neither a keyword nor an ALL_CAPS constant
[[nodiscard]] bool is_variable_operand(std::string_view token)
{
    if (token.empty() || std::isdigit(static_cast<unsigned char>(token.front())) != 0) {
        return false;
    }
    if (std::ranges::find(kNonOperandWords, token) != kNonOperandWords.end()) {
        return false;
    }
    const bool all_caps = std::ranges::none_of(
        token, [](char c) { return std::islower(static_cast<unsigned char>(c)) != 0; });
    return !all_caps;
}

/// Argument text of the call whose '(' sits at open_paren, up to its ')' or end of line
[[nodiscard]] std::string_view call_arguments(std::string_view code, std::size_t open_paren)
{
    int depth = 0;
    for (std::size_t i = open_paren; i < code.size(); ++i) {
        if (code[i] == '(') {
            ++depth;
        } else if (code[i] == ')') {
            if (--depth == 0) {
                return code.substr(open_paren + 1, i - open_paren - 1);
            }
        }
    }
    return code.substr(std::min(open_paren + 1, code.size()));
}

/// True when args contain a binary '*' with at least one variable operand
[[nodiscard]] bool has_variable_multiplication(std::string_view args)
{
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] != '*' || (i + 1 < args.size() && args[i + 1] == '=')) {
            continue;
        }
        std::size_t left = i;
        while (left > 0 && args[left - 1] == ' ') {
            --left;
        }
        if (left == 0) {
            continue;
        }
        const char lc = args[left - 1];
        if (!is_ident_char(lc) && lc != ')' && lc != ']') {
            continue;  // dereference
        }
        std::size_t right = i + 1;
        while (right < args.size() && args[right] == ' ') {
            ++right;
        }
        if (right >= args.size() || args[right] == ')' || args[right] == ',' || args[right] == '*') {
            continue;  // pointer declarator such as sizeof(char *)
        }
        const auto left_token = identifier_before(args, left);
        const auto right_token = identifier_at(args, right);
        if (is_variable_operand(left_token) || is_variable_operand(right_token)) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] bool has_relational_comparison(std::string_view condition)
{
    std::string text(condition);
    for (std::string_view token : {"->", ">>=", "<<=", ">>", "<<"}) {
        for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos)) {
            text.replace(pos, token.size(), std::string(token.size(), ' '));
        }
    }
    return text.find_first_of("<>") != std::string::npos;
}

}  // namespace

std::string strip_comment(std::string_view line)
{
    std::size_t first = line.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    std::string_view body = line.substr(first);
    if (body.starts_with("/*") || body.starts_with("*")) {
        return {};
    }
    if (auto pos = body.find("//"); pos != std::string_view::npos) {
        body = body.substr(0, pos);
    }
    return std::string(body);
}

bool is_allocation_call(std::string_view code)
{
    return search(code, allocation_regex()) || search(code, array_new_regex());
}

bool is_allocation_sizing(std::string_view code)
{
    SvMatch match;
    auto begin = code.begin();
    while (std::regex_search(begin, code.end(), match, allocation_regex())) {
        const auto paren = static_cast<std::size_t>(match[0].second - code.begin()) - 1;
        if (has_variable_multiplication(call_arguments(code, paren))) {
            return true;
        }
        begin = match[0].second;
    }
    if (std::regex_search(code.begin(), code.end(), match, array_new_regex())) {
        const std::string extent = match[1].str();
        for (std::size_t i = 0; i < extent.size();) {
            const auto token = identifier_at(extent, i);
            if (token.empty()) {
                ++i;
                continue;
            }
            if (is_variable_operand(token)) {
                return true;
            }
            i += token.size();
        }
    }
    return false;
}

bool is_memory_copy(std::string_view code)
{
    return search(code, copy_regex());
}

bool has_overflow_check(std::string_view code)
{
    return search(code, overflow_regex());
}

bool is_guard(std::string_view code)
{
    if (search(code, bounds_helper_regex())) {
        return true;
    }
    SvMatch match;
    if (!std::regex_search(code.begin(), code.end(), match, conditional_regex())) {
        return false;
    }
    const auto paren = static_cast<std::size_t>(match[0].second - code.begin()) - 1;
    const auto condition = call_arguments(code, paren);
    return has_relational_comparison(condition) || has_overflow_check(condition);
}

bool is_parsing_marker(std::string_view code)
{
    if (search(code, byte_order_read_regex()) || search(code, pointer_cast_load_regex())
        || search(code, scanf_regex())) {
        return true;
    }
    return search(code, parse_call_regex()) && search(code, length_field_regex());
}

bool is_privilege_check(std::string_view code)
{
    return search(code, privilege_regex());
}

}  // namespace ossensor::source::patterns
