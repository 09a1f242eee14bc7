#ifndef GDS_UTIL_PRINT_HPP
#define GDS_UTIL_PRINT_HPP

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace gds
{
namespace util
{

namespace detail
{

template <typename T>
std::string to_string(const T& value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

inline std::string to_string(bool value)
{
    return value ? "true" : "false";
}

// Replaces each "{}" in `pattern` with the next argument.  Placeholders
// without a matching argument expand to nothing; extra arguments are dropped.
template <typename... Args>
std::string format(const std::string& pattern, const Args&... args)
{
    const std::vector<std::string> arg_list = {to_string(args)...};

    std::string out;
    out.reserve(pattern.size());

    size_t arg_index = 0;
    size_t pos = 0;
    while (pos < pattern.size())
    {
        const size_t open_brace = pattern.find("{}", pos);
        if (open_brace == std::string::npos)
        {
            out.append(pattern, pos, std::string::npos);
            break;
        }

        out.append(pattern, pos, open_brace - pos);
        if (arg_index < arg_list.size())
        {
            out += arg_list[arg_index++];
        }
        pos = open_brace + 2;
    }

    return out;
}

}  // namespace detail

template <typename... Args>
void println(const std::string& message, const Args&... args)
{
    std::cout << detail::format(message, args...) << std::endl;
}

template <typename... Args>
void eprintln(const std::string& message, const Args&... args)
{
    std::cerr << detail::format(message, args...) << std::endl;
}

}  // namespace util
}  // namespace gds

#endif  // GDS_UTIL_PRINT_HPP
