#ifndef debug_hh_INCLUDED
#define debug_hh_INCLUDED

#include "meta.hh"
#include "enum.hh"
#include "flags.hh"

namespace TextSeek
{

class StringView;

enum class DebugFlags
{
    None    = 0,
    Options = 1 << 0,
    Seeks   = 1 << 1,
};

constexpr bool with_bit_ops(Meta::Type<DebugFlags>) { return true; }

constexpr auto enum_desc(Meta::Type<DebugFlags>)
{
    return make_array<EnumDesc<DebugFlags>>({
        { DebugFlags::Options, "options" },
        { DebugFlags::Seeks, "seeks" },
    });
}

using DebugLogSink = void (*)(StringView str);

// Messages go to stderr unless a host installed its own sink.
// Passing nullptr restores the default.
void set_debug_log_sink(DebugLogSink sink);

void write_to_debug_log(StringView str);

}

#endif // debug_hh_INCLUDED
