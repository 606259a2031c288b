#include "debug.hh"

#include "string.hh"

#include <unistd.h>

namespace TextSeek
{

static DebugLogSink debug_log_sink = nullptr;

static void write(int fd, StringView str)
{
    const char* data = str.data();
    ssize_t count = (int)str.length();
    while (count > 0)
    {
        ssize_t written = ::write(fd, data, count);
        if (written == -1)
            return;
        count -= written;
        data += written;
    }
}

void set_debug_log_sink(DebugLogSink sink)
{
    debug_log_sink = sink;
}

void write_to_debug_log(StringView str)
{
    if (debug_log_sink)
        return debug_log_sink(str);

    write(2, str);
    if (str.empty() or str.back() != '\n')
        write(2, "\n");
}

}
