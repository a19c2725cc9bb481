#pragma once

#include <algorithm>
#include <array>
#include <charconv>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace tare {

    using namespace std::string_view_literals;

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr bool is_identifier(std::string_view text) {
            if (text.empty()) {
                return false;
            }
            auto is_head = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
            auto is_tail = [&](char c) { return is_head(c) || (c >= '0' && c <= '9'); };
            return is_head(text.front()) && std::ranges::all_of(text.substr(1U), is_tail);
        }

        // C++23 keywords and alternative tokens
        inline constexpr auto cpp_keywords = std::array{
                "alignas"sv, "alignof"sv, "and"sv, "and_eq"sv, "asm"sv, "auto"sv, "bitand"sv, "bitor"sv,
                "bool"sv, "break"sv, "case"sv, "catch"sv, "char"sv, "char8_t"sv, "char16_t"sv, "char32_t"sv,
                "class"sv, "compl"sv, "concept"sv, "const"sv, "consteval"sv, "constexpr"sv, "constinit"sv,
                "const_cast"sv, "continue"sv, "co_await"sv, "co_return"sv, "co_yield"sv, "decltype"sv,
                "default"sv, "delete"sv, "do"sv, "double"sv, "dynamic_cast"sv, "else"sv, "enum"sv, "explicit"sv,
                "export"sv, "extern"sv, "false"sv, "float"sv, "for"sv, "friend"sv, "goto"sv, "if"sv, "inline"sv,
                "int"sv, "long"sv, "mutable"sv, "namespace"sv, "new"sv, "noexcept"sv, "not"sv, "not_eq"sv,
                "nullptr"sv, "operator"sv, "or"sv, "or_eq"sv, "private"sv, "protected"sv, "public"sv,
                "register"sv, "reinterpret_cast"sv, "requires"sv, "return"sv, "short"sv, "signed"sv, "sizeof"sv,
                "static"sv, "static_assert"sv, "static_cast"sv, "struct"sv, "switch"sv, "template"sv, "this"sv,
                "thread_local"sv, "throw"sv, "true"sv, "try"sv, "typedef"sv, "typeid"sv, "typename"sv,
                "union"sv, "unsigned"sv, "using"sv, "virtual"sv, "void"sv, "volatile"sv, "wchar_t"sv, "while"sv,
                "xor"sv, "xor_eq"sv};

        // Identifier that is safe to emit as a C++ name in generated code
        constexpr bool is_emittable_identifier(std::string_view text) {
            return is_identifier(text) && std::ranges::find(cpp_keywords, text) == cpp_keywords.end();
        }

        // `*` matches any run of characters; everything else matches literally
        constexpr bool wildcard_match(std::string_view pattern, std::string_view text) {
            size_t p = 0U;
            size_t t = 0U;
            auto star = std::string_view::npos;
            size_t resume = 0U;
            while (t < text.size()) {
                if (p < pattern.size() && pattern[p] == '*') {
                    star = p++;
                    resume = t;
                }
                else if (p < pattern.size() && pattern[p] == text[t]) {
                    ++p;
                    ++t;
                }
                else if (star != std::string_view::npos) {
                    p = star + 1U;
                    t = ++resume;
                }
                else {
                    return false;
                }
            }
            while (p < pattern.size() && pattern[p] == '*') {
                ++p;
            }
            return p == pattern.size();
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace tare
