#include "format.hh"

#include "exception.hh"
#include "string_utils.hh"
#include "unit_tests.hh"

#include <algorithm>
#include <charconv>

namespace TextSeek
{

template<size_t N>
InplaceString<N> to_string_impl(auto val, int base = 10)
{
    InplaceString<N> res;
    auto [end, errc] = std::to_chars(res.m_data, res.m_data + N, val, base);
    if (errc != std::errc{})
        throw runtime_error("to_string error");
    res.m_length = end - res.m_data;
    *end = '\0';
    return res;
}

InplaceString<15> to_string(int val)
{
    return to_string_impl<15>(val);
}

InplaceString<15> to_string(unsigned val)
{
    return to_string_impl<15>(val);
}

InplaceString<23> to_string(long int val)
{
    return to_string_impl<23>(val);
}

InplaceString<23> to_string(long long int val)
{
    return to_string_impl<23>(val);
}

InplaceString<23> to_string(unsigned long val)
{
    return to_string_impl<23>(val);
}

InplaceString<23> to_string(Hex val)
{
    return to_string_impl<23>(val.val, 16);
}

InplaceString<7> to_string(Codepoint c)
{
    InplaceString<7> res;
    char* ptr = res.m_data;
    utf8::dump(ptr, c);
    res.m_length = (int)(ptr - res.m_data);
    return res;
}

template<typename AppendFunc>
void format_impl(StringView fmt, ArrayView<const StringView> params, AppendFunc append)
{
    int implicitIndex = 0;
    for (auto it = fmt.begin(), end = fmt.end(); it != end;)
    {
        auto opening = std::find(it, end, '{');
        if (opening == end)
        {
            append(StringView{it, opening});
            break;
        }
        else if (opening != it and *(opening-1) == '\\')
        {
            append(StringView{it, opening-1});
            append(StringView{"{"});
            it = opening + 1;
        }
        else
        {
            append(StringView{it, opening});
            auto closing = std::find(opening, end, '}');
            if (closing == end)
                throw runtime_error("format string error, unclosed '{'");

            auto format = std::find(opening+1, closing, ':');
            const int index = opening+1 == format ? implicitIndex : str_to_int({opening+1, format});

            if (index < 0 or (size_t)index >= params.size())
                throw runtime_error("format string parameter index too big");

            if (format != closing)
            {
                char padding = ' ';
                if (*(++format) == '0')
                {
                    padding = '0';
                    ++format;
                }
                for (CharCount width = str_to_int({format, closing}), len = params[index].char_length();
                     width > len; --width)
                    append(StringView{padding});
            }

            append(params[index]);
            implicitIndex = index+1;
            it = closing+1;
        }
    }
}

String format(StringView fmt, ArrayView<const StringView> params)
{
    ByteCount size = fmt.length();
    for (auto& s : params) size += s.length();
    String res;
    res.reserve(size);

    format_impl(fmt, params, [&](StringView s) { res += s; });
    return res;
}

UnitTest test_format{[]()
{
    ts_assert(format("{}:{}", 3, 4_char) == "3:4");
    ts_assert(format("{1} {0}", "anchor", "active") == "active anchor");
    ts_assert(format("{:03}", 7) == "007");
    ts_assert(format("\\{} {}", U'¶') == "{} ¶");
    ts_assert(format("{}", hex(0x3002)) == "3002");
    ts_expect_throw(runtime_error, format("{", 1));
    ts_expect_throw(runtime_error, format("{} {}", 1));
}};

}
