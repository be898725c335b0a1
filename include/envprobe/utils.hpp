#pragma once

#include <algorithm>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace envprobe {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << "[envprobe " << sloc_fname(loc) << ':' << loc.line() << "] ";
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

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        // basename of a path-like string, tolerating both separators
        constexpr std::string_view path_stem(std::string_view path) {
            if (auto p = path.find_last_of("/\\"); p != std::string_view::npos) {
                path.remove_prefix(p + 1U);
            }
            if (path.size() > 4U && str_case_eq(path.substr(path.size() - 4U), ".exe")) {
                path.remove_suffix(4U);
            }
            return path;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace envprobe
