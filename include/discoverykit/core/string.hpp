/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace dsk {

/**
 * Compares 2 strings case-insensitively.
 * @param lhs Left hand side
 * @param rhs Right hand side
 * @return True if strings are equal, false otherwise.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

/**
 * Converts the first `count` characters of a string to lower case.
 * @param str The string to convert.
 * @param count The number of leading characters to convert to lower case.
 * @return A new string with the first `count` characters converted to lower case.
 */
inline std::string string_to_lower(const std::string& str, std::size_t count = std::numeric_limits<size_t>::max()) {
    if (str.empty() || count == 0) {
        return str;
    }
    std::string result = str;
    count = std::min(count, result.size());
    for (std::size_t i = 0; i < count; ++i) {
        result[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(result[i])));
    }
    return result;
}

/**
 * Checks if a string ends with a given suffix.
 * @param text The text to check.
 * @param ends_with The suffix.
 * @return True if text ends with given suffix.
 */
inline bool string_ends_with(const std::string_view text, const std::string_view ends_with) {
    if (ends_with.size() > text.size()) {
        return false;
    }
    return text.compare(text.size() - ends_with.size(), ends_with.size(), ends_with) == 0;
}

/**
 * Converts a string to an integer type.
 * @tparam Type The integer type.
 * @param string The string to convert.
 * @return The converted value, or an empty optional if the string is not a valid number or doesn't fit into Type.
 */
template<typename Type>
std::optional<Type> string_to_int(const std::string_view string) {
    Type value {};
    const auto result = std::from_chars(string.data(), string.data() + string.size(), value);
    if (result.ec != std::errc() || result.ptr != string.data() + string.size()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace dsk
