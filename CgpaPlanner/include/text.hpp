#pragma once
#include <algorithm>
#include <cctype>
#include <string>

/*
-------------------------------------------------------------------------------
 text.hpp - Small string helpers shared by the core and the console
-------------------------------------------------------------------------------
ASCII only: bytes are classified with the C locale functions through
unsigned char, so UTF-8 sequences pass through unchanged.
-------------------------------------------------------------------------------
*/

// Trim leading and trailing whitespace.
inline std::string trim(std::string s) {
    auto ws = [](int ch) { return std::isspace(static_cast<unsigned char>(ch)); };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

inline std::string to_upper(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}
