#include "string.hh"

#include "unit_tests.hh"

#include <iterator>

namespace TextSeek
{

const String String::ms_empty;

String::String(Codepoint cp, CharCount count)
{
    reserve(utf8::codepoint_size(cp) * (int)count);
    while (count-- > 0)
        utf8::dump(std::back_inserter(*this), cp);
}

UnitTest test_string{[]()
{
    ts_assert(String{U'é', 2} == "éé"_sv);
    ts_assert(StringView{"maïs"}.char_length() == 4);
    ts_assert(StringView{"extra_word_chars"}.starts_with("extra"));
    ts_assert(StringView{"caret"}.substr(1_byte, 3_byte) == "are");
    ts_assert("abc"_sv < "abd"_sv);
}};

}
