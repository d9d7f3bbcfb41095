#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace callsheet::utils {

    constexpr char char_tolower(char c) {
        if (c >= 'A' && c <= 'Z') {
            return c + ('a' - 'A');
        }
        return c;
    }

    constexpr char char_toupper(char c) {
        if (c >= 'a' && c <= 'z') {
            return c - ('a' - 'A');
        }
        return c;
    }

    constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
        return std::ranges::equal(
                lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
    }

    // ASCII only; UTF-8 continuation bytes pass through untouched
    inline std::string to_lower(std::string_view value) {
        std::string out{value};
        std::ranges::transform(out, out.begin(), char_tolower);
        return out;
    }

    constexpr bool is_ascii_alpha(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    constexpr bool is_ascii_alnum(char c) {
        return is_ascii_alpha(c) || (c >= '0' && c <= '9');
    }

    constexpr bool is_non_ascii(char c) {
        return static_cast<unsigned char>(c) >= 0x80U;
    }

    constexpr std::string_view trim_view(std::string_view value) {
        auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) {
            return {};
        }
        auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1U);
    }

    inline std::string trim(std::string_view value) {
        return std::string{trim_view(value)};
    }

    inline std::vector<std::string> split_lines(std::string_view text) {
        std::vector<std::string> lines{};
        std::istringstream in{std::string{text}};
        std::string line{};
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(std::move(line));
        }
        return lines;
    }

    // Number of UTF-8 code points
    constexpr std::size_t utf8_length(std::string_view value) {
        return static_cast<std::size_t>(std::ranges::count_if(
                value, [](char c) { return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U; }));
    }

    // First `count` code points of a UTF-8 string
    constexpr std::string_view utf8_prefix(std::string_view value, std::size_t count) {
        std::size_t seen = 0;
        for (std::size_t i = 0; i < value.size(); ++i) {
            if ((static_cast<unsigned char>(value[i]) & 0xC0U) != 0x80U) {
                if (seen == count) {
                    return value.substr(0, i);
                }
                ++seen;
            }
        }
        return value;
    }

    inline std::string collapse_whitespace(std::string_view value) {
        std::string out{};
        out.reserve(value.size());
        bool pending_space = false;
        for (char c : trim_view(value)) {
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                pending_space = true;
                continue;
            }
            if (pending_space && !out.empty()) {
                out.push_back(' ');
            }
            pending_space = false;
            out.push_back(c);
        }
        return out;
    }

    // Arabic-Indic (U+0660..U+0669) and Eastern Arabic-Indic (U+06F0..U+06F9) digits to ASCII
    inline std::string normalize_digits(std::string_view text) {
        std::string out{};
        out.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            auto lead = static_cast<unsigned char>(text[i]);
            if (i + 1U < text.size() && (lead == 0xD9U || lead == 0xDBU)) {
                auto trail = static_cast<unsigned char>(text[i + 1U]);
                if (lead == 0xD9U && trail >= 0xA0U && trail <= 0xA9U) {
                    out.push_back(static_cast<char>('0' + (trail - 0xA0U)));
                    ++i;
                    continue;
                }
                if (lead == 0xDBU && trail >= 0xB0U && trail <= 0xB9U) {
                    out.push_back(static_cast<char>('0' + (trail - 0xB0U)));
                    ++i;
                    continue;
                }
            }
            out.push_back(text[i]);
        }
        return out;
    }

    /// Case-insensitive search of `term` in `haystack_lower` (already lowered). ASCII terms must sit on
    /// word boundaries; terms in other scripts match as plain substrings.
    inline bool contains_term(std::string_view haystack_lower, std::string_view term) {
        auto needle = to_lower(term);
        if (needle.empty()) {
            return false;
        }
        bool ascii_edges = !is_non_ascii(needle.front()) && !is_non_ascii(needle.back());
        std::size_t pos = 0;
        while ((pos = haystack_lower.find(needle, pos)) != std::string_view::npos) {
            if (!ascii_edges) {
                return true;
            }
            auto end = pos + needle.size();
            bool left_ok = pos == 0 || !is_ascii_alnum(haystack_lower[pos - 1U]);
            bool right_ok = end >= haystack_lower.size() || !is_ascii_alnum(haystack_lower[end]);
            if (left_ok && right_ok) {
                return true;
            }
            ++pos;
        }
        return false;
    }

    template <typename T>
    constexpr void append_unique(std::vector<T>& values, T value) {
        if (std::ranges::find(values, value) == values.end()) {
            values.push_back(std::move(value));
        }
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

    inline std::string hash_hex(std::string_view key) {
        std::ostringstream ss{};
        ss << std::hex << std::hash<std::string_view>{}(key);
        return ss.str();
    }

}  // namespace callsheet::utils
