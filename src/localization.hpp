#ifndef LOCALIZATION_HPP
#define LOCALIZATION_HPP

#include <cstdio>
#include <string>
#include <vector>

void init_localization();
void load_strings(const std::string& lang);
const std::string& get_string(const std::string& key);

namespace detail {
    template<typename T>
    auto format_arg(const T& value) { return value; }

    inline const char* format_arg(const std::string& value) { return value.c_str(); }
}

// Variadic template for string formatting, std::string arguments are passed as C strings
template<typename... Args>
std::string string_format(const std::string& format_key, const Args&... args) {
    const std::string& format = get_string(format_key);
    int size = snprintf(nullptr, 0, format.c_str(), detail::format_arg(args)...) + 1; // Extra space for '\0'
    if (size <= 1) { return format; }
    std::vector<char> buf(size);
    snprintf(buf.data(), size, format.c_str(), detail::format_arg(args)...);
    return std::string(buf.data(), buf.data() + size - 1); // We don't want the '\0' inside
}

#endif // LOCALIZATION_HPP
