#include "debug.hh"
#include "exception.hh"
#include "format.hh"
#include "unit_tests.hh"

using namespace TextSeek;

int main()
{
    try
    {
        UnitTest::run_all_tests();
    }
    catch (exception& error)
    {
        write_to_debug_log(format("unit tests failed: {}", error.what()));
        return 1;
    }
    write_to_debug_log("all unit tests passed");
    return 0;
}
