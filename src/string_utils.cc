#include "string_utils.hh"

#include "exception.hh"
#include "format.hh"
#include "unit_tests.hh"

#include <algorithm>
#include <climits>

namespace TextSeek
{

Vector<StringView> split(StringView str, char separator)
{
    Vector<StringView> res;
    if (str.empty())
        return res;

    auto beg = str.begin();
    for (auto it = beg; it != str.end(); ++it)
    {
        if (*it == separator)
        {
            res.emplace_back(beg, it);
            beg = it + 1;
        }
    }
    res.emplace_back(beg, str.end());
    return res;
}

String join(ConstArrayView<StringView> strings, char separator)
{
    String res;
    bool first = true;
    for (auto& str : strings)
    {
        if (not first)
            res.push_back(separator);
        res += str;
        first = false;
    }
    return res;
}

Optional<int> str_to_int_ifp(StringView str)
{
    bool negative = not str.empty() and str[0] == '-';
    if (negative)
        str = str.substr(1_byte);
    if (str.empty())
        return {};

    unsigned int res = 0;
    for (auto c : str)
    {
        if (c < '0' or c > '9')
            return {};
        res = res * 10 + c - '0';
    }
    return negative ? -res : res;
}

int str_to_int(StringView str)
{
    if (auto val = str_to_int_ifp(str))
        return *val;
    throw runtime_error{format("'{}' is not a number", str)};
}

UnitTest test_string_utils{[]()
{
    auto words = split("caret|character", '|');
    ts_assert(words.size() == 2 and words[0] == "caret" and words[1] == "character");
    ts_assert(split("", '|').empty());
    ts_assert(split("a||b", '|').size() == 3);

    StringView flags[] = { "options", "seeks" };
    ts_assert(join(flags, '|') == "options|seeks");

    ts_assert(str_to_int("5") == 5);
    ts_assert(str_to_int(to_string(INT_MAX)) == INT_MAX);
    ts_assert(str_to_int(to_string(INT_MIN)) == INT_MIN);
    ts_assert(str_to_int("-0") == 0);
    ts_assert(not str_to_int_ifp("4x"));
    ts_expect_throw(runtime_error, str_to_int("caret"));
}};

}
