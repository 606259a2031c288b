#ifndef coord_hh_INCLUDED
#define coord_hh_INCLUDED

#include "units.hh"

namespace TextSeek
{

template<typename EffectiveType, typename LineType, typename ColumnType>
struct LineAndColumn
{
    LineType   line = 0;
    ColumnType column = 0;

    [[gnu::always_inline]]
    constexpr auto operator<=> (EffectiveType other) const
    {
        return (line != other.line) ? line <=> other.line
                                    : column <=> other.column;
    }

    [[gnu::always_inline]]
    constexpr bool operator== (EffectiveType other) const
    {
        return line == other.line and column == other.column;
    }
};

// A position in a document. column == line length denotes the line
// break slot of that line.
struct Position : LineAndColumn<Position, LineCount, CharCount>
{
    [[gnu::always_inline]]
    constexpr Position(LineCount line = 0, CharCount column = 0)
        : LineAndColumn{line, column} {}
};

enum Direction { Backward = -1, Forward = 1 };

}

#endif // coord_hh_INCLUDED
