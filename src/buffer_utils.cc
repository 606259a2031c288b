#include "buffer_utils.hh"

#include "unit_tests.hh"

namespace TextSeek
{

CharCount first_non_blank_column(const Document& document, LineCount line)
{
    auto content = document.line(line);
    CharCount column = 0;
    while (column < (int)content.size() and is_horizontal_blank(content[(size_t)column]))
        ++column;
    return column;
}

Position next_coord(const Document& document, Position pos)
{
    if (pos.column < document.line_length(pos.line))
        return {pos.line, pos.column + 1};
    if (pos.line < last_line(document))
        return line_start(pos.line + 1);
    return pos;
}

Position prev_coord(const Document& document, Position pos)
{
    if (pos.column > 0)
        return {pos.line, pos.column - 1};
    if (pos.line > 0)
        return line_break(document, pos.line - 1);
    return pos;
}

Optional<Position> offset_coord(const Document& document, Position pos, Direction direction)
{
    if (direction == Forward ? pos == document_end(document) : pos == Position{})
        return {};
    return direction == Forward ? next_coord(document, pos) : prev_coord(document, pos);
}

Position to_selection_end(const Document& document, SelectionBehavior behavior,
                          Position inclusive_end)
{
    if (behavior == SelectionBehavior::Caret)
        return next_coord(document, inclusive_end);

    if (inclusive_end == document_end(document) and inclusive_end.column > 0)
        return {inclusive_end.line, inclusive_end.column - 1};
    return inclusive_end;
}

UnitTest test_position_math{[]()
{
    StringDocument doc{"ab\n\n  c"};
    ts_assert(document_end(doc) == Position{2, 3});
    ts_assert(char_at(doc, {0, 1}) == 'b');
    ts_assert(char_at(doc, {0, 2}) == '\n');
    ts_assert(char_at(doc, {1, 0}) == '\n');
    ts_assert(char_at(doc, {2, 3}) == 0);
    ts_assert(char_at(doc, {0, 5}) == 0);

    ts_assert(next_coord(doc, {0, 2}) == Position{1, 0});
    ts_assert(next_coord(doc, {1, 0}) == Position{2, 0});
    ts_assert(next_coord(doc, {2, 3}) == Position{2, 3});
    ts_assert(prev_coord(doc, {2, 0}) == Position{1, 0});
    ts_assert(prev_coord(doc, {1, 0}) == Position{0, 2});
    ts_assert(prev_coord(doc, {0, 0}) == Position{0, 0});

    ts_assert(not offset_coord(doc, {0, 0}, Backward));
    ts_assert(not offset_coord(doc, {2, 3}, Forward));
    ts_assert(*offset_coord(doc, {0, 2}, Forward) == Position{1, 0});

    ts_assert(first_non_blank_column(doc, 2) == 2);
    ts_assert(first_non_blank_column(doc, 1) == 0);

    auto is_blank_or_eol = [](Codepoint c) { return c == ' ' or c == '\n'; };
    auto fwd = skip_forward(doc, {0, 2}, is_blank_or_eol);
    ts_assert(fwd.pos == Position{2, 2} and not fwd.reached_edge);
    auto back = skip_backward(doc, {2, 1}, is_blank_or_eol);
    ts_assert(back.pos == Position{0, 1} and not back.reached_edge);
    auto to_start = skip_backward(doc, {0, 1}, [](Codepoint c) { return c != 0; });
    ts_assert(to_start.pos == Position{0, 0} and to_start.reached_edge);
    auto to_end = skip_forward(doc, {2, 0}, [](Codepoint) { return true; });
    ts_assert(to_end.pos == Position{2, 3} and to_end.reached_edge);

    ts_assert(to_selection_end(doc, SelectionBehavior::Caret, {0, 1}) == Position{0, 2});
    ts_assert(to_selection_end(doc, SelectionBehavior::Caret, {0, 2}) == Position{1, 0});
    ts_assert(to_selection_end(doc, SelectionBehavior::Caret, {2, 3}) == Position{2, 3});
    ts_assert(to_selection_end(doc, SelectionBehavior::Character, {0, 2}) == Position{0, 2});
    ts_assert(to_selection_end(doc, SelectionBehavior::Character, {2, 3}) == Position{2, 2});
}};

}
