#include "unit_tests.hh"

#include "utf8.hh"
#include "string.hh"

namespace TextSeek
{

UnitTest test_utf8{[]()
{
    StringView str = "maïs mélange bientôt";
    ts_assert(utf8::distance(std::begin(str), std::end(str)) == 20);
    ts_assert(utf8::codepoint(std::begin(str) + 2, std::end(str)) == 0x00EF);

    StringView ideographic = "\xE3\x80\x82";
    ts_assert(utf8::codepoint(ideographic.begin(), ideographic.end()) == 0x3002);
    StringView emoji = "\xF0\x9F\x98\x80";
    ts_assert(utf8::codepoint(emoji.begin(), emoji.end()) == 0x1F600);
    ts_assert(utf8::codepoint_size(0x1F600) == 4);
}};

#ifdef TS_DEBUG
UnitTest* UnitTest::list = nullptr;

void UnitTest::run_all_tests()
{
    for (const UnitTest* test = UnitTest::list; test; test = test->next)
        test->func();
}
#endif

}
