#ifndef TOOLS_STREAM_H
#define TOOLS_STREAM_H

#include <ostream>
#include <vector>


// {a, b, c}, e.g. for logging span lists
template <typename T>
std::ostream& operator<< (std::ostream& out, const std::vector<T>& v)
{
    out << '{';
    auto sep = "";
    for (const auto& x : v)
    {
        out << sep << x;
        sep = ", ";
    }
    out << '}';
    return out;
}

#endif // TOOLS_STREAM_H
