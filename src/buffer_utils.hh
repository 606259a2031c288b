#ifndef buffer_utils_hh_INCLUDED
#define buffer_utils_hh_INCLUDED

#include "coord.hh"
#include "document.hh"
#include "optional.hh"
#include "selection.hh"

namespace TextSeek
{

inline LineCount last_line(const Document& document)
{
    return document.line_count() - 1;
}

inline Position line_start(LineCount line)
{
    return {line, 0};
}

inline Position line_break(const Document& document, LineCount line)
{
    return {line, document.line_length(line)};
}

// The line break slot of the last line, one past the last character
inline Position document_end(const Document& document)
{
    return line_break(document, last_line(document));
}

inline bool is_empty_line(const Document& document, LineCount line)
{
    return document.line(line).empty();
}

// Codepoint at pos; a line break slot reads '\n' except on the last line,
// which together with columns past the line end reads 0.
inline Codepoint char_at(const Document& document, Position pos)
{
    auto line = document.line(pos.line);
    if (pos.column < (int)line.size())
        return line[(size_t)pos.column];
    return (pos.column == (int)line.size() and pos.line < last_line(document)) ? '\n' : 0;
}

CharCount first_non_blank_column(const Document& document, LineCount line);

// Clamped at document edges
Position next_coord(const Document& document, Position pos);
Position prev_coord(const Document& document, Position pos);

// Steps one character in direction, nothing if that leaves the document
Optional<Position> offset_coord(const Document& document, Position pos, Direction direction);

struct ScanResult
{
    Position pos;
    bool reached_edge;
};

// Walks from pos while func accepts the codepoint under the position,
// pos itself included. Stops on the first rejected position, or on the
// document end when every codepoint was accepted.
template<typename Func>
ScanResult skip_forward(const Document& document, Position pos, Func func)
{
    const Position end = document_end(document);
    while (func(char_at(document, pos)))
    {
        if (pos == end)
            return {pos, true};
        pos = next_coord(document, pos);
    }
    return {pos, false};
}

template<typename Func>
ScanResult skip_backward(const Document& document, Position pos, Func func)
{
    while (func(char_at(document, pos)))
    {
        if (pos == Position{})
            return {pos, true};
        pos = prev_coord(document, pos);
    }
    return {pos, false};
}

template<typename Func>
ScanResult skip(const Document& document, Position pos, Direction direction, Func func)
{
    return direction == Forward ? skip_forward(document, pos, func)
                                : skip_backward(document, pos, func);
}

// Objects are computed with inclusive ends, this gives the end reported
// to callers depending on the selection behavior.
Position to_selection_end(const Document& document, SelectionBehavior behavior,
                          Position inclusive_end);

}

#endif // buffer_utils_hh_INCLUDED
