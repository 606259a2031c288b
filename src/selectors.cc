#include "selectors.hh"

#include "buffer_utils.hh"
#include "context.hh"
#include "document.hh"
#include "option_types.hh"
#include "optional.hh"
#include "scope.hh"
#include "string.hh"
#include "unicode.hh"
#include "unit_tests.hh"

#include <algorithm>
#include <iterator>
#include <utility>

namespace TextSeek
{

namespace
{

Position selection_end(const Context& context, Position inclusive_end)
{
    return to_selection_end(context.document(), context.selection_behavior(), inclusive_end);
}

Codepoint char_at_column(ConstArrayView<Codepoint> line, CharCount column)
{
    return column >= 0 and column < (int)line.size() ? line[(size_t)column] : 0;
}

}

Optional<Selection>
word_boundary(const Context& context, Direction direction, Position origin,
              bool stop_at_end, CharSet word_set)
{
    auto& document = context.document();
    auto& classifier = context.classifier();
    const bool caret = context.selection_behavior() == SelectionBehavior::Caret;

    auto origin_line = document.line(origin.line);
    const CharCount line_end_column = (int)origin_line.size() - (caret ? 0 : 1);

    Position anchor = origin;
    if (direction == Forward ? origin.column >= line_end_column : origin.column <= 1)
    {
        LineCount line = origin.line + direction;
        while (line >= 0 and line < document.line_count() and is_empty_line(document, line))
            line += direction;
        if (line < 0 or line >= document.line_count())
            return {};
        anchor = direction == Forward ? line_start(line) : line_break(document, line);
    }
    else if (not caret)
    {
        // Character mode: step off the character under the cursor when
        // it ends a run, so that repeated seeks make progress
        const CharCount column = origin.column - (direction == Backward ? 1 : 0);
        const auto category = classifier.classify(char_at_column(origin_line, column), word_set);
        const auto next_category = classifier.classify(char_at_column(origin_line, column + direction), word_set);
        if (category != next_category and
            not (stop_at_end == (direction == Forward) and category == CharCategory::Blank))
            anchor.column += direction;
    }

    auto is_word = [&](Codepoint c) { return classifier.matches(c, word_set); };
    auto is_blank = [&](Codepoint c) { return classifier.is_blank(c); };
    auto is_punctuation = [&](Codepoint c) { return not is_word(c) and not is_blank(c); };

    auto line = document.line(anchor.line);
    CharCount column = anchor.column - (direction == Backward ? 1 : 0);
    auto in_line = [&] { return column >= 0 and column < (int)line.size(); };
    auto current = [&] { return line[(size_t)column]; };

    if (stop_at_end == (direction == Forward))
    {
        while (in_line() and is_blank(current()))
            column += direction;
    }
    if (in_line())
    {
        const bool word = is_word(current());
        while (in_line() and (word ? is_word(current()) : is_punctuation(current())))
            column += direction;
    }
    if (stop_at_end == (direction == Backward))
    {
        while (in_line() and is_blank(current()))
            column += direction;
    }

    return Selection{anchor, {anchor.line, direction == Backward ? column + 1 : column}};
}

namespace
{

// Run of characters sharing the category of the one at pos, on its line
template<WordType word_type>
std::pair<Position, Position> word_run(const Context& context, Position pos, bool inner)
{
    auto& classifier = context.classifier();
    const CharSet word_set = word_type == WordType::WORD ? CharSet::NonBlank : CharSet::Word;
    auto line = context.document().line(pos.line);
    const CharCount length = (int)line.size();
    if (pos.column >= length)
        return {pos, pos};

    auto category = [&](CharCount column) { return classifier.classify(line[(size_t)column], word_set); };
    const auto run_category = category(pos.column);
    CharCount first = pos.column;
    CharCount last = pos.column;
    while (first > 0 and category(first - 1) == run_category)
        --first;
    while (last + 1 < length and category(last + 1) == run_category)
        ++last;
    if (not inner)
    {
        while (last + 1 < length and is_horizontal_blank(line[(size_t)(last + 1)]))
            ++last;
    }
    return {{pos.line, first}, {pos.line, last}};
}

}

template<WordType word_type>
Selection select_word(const Context& context, Position pos, bool inner)
{
    auto run = word_run<word_type>(context, pos, inner);
    return {run.first, selection_end(context, run.second)};
}
template Selection select_word<WordType::Word>(const Context&, Position, bool);
template Selection select_word<WordType::WORD>(const Context&, Position, bool);

template<WordType word_type>
Position word_start(const Context& context, Position pos, bool inner)
{
    return word_run<word_type>(context, pos, inner).first;
}
template Position word_start<WordType::Word>(const Context&, Position, bool);
template Position word_start<WordType::WORD>(const Context&, Position, bool);

template<WordType word_type>
Position word_end(const Context& context, Position pos, bool inner, Optional<Position> start)
{
    return selection_end(context, word_run<word_type>(context, start.value_or(pos), inner).second);
}
template Position word_end<WordType::Word>(const Context&, Position, bool, Optional<Position>);
template Position word_end<WordType::WORD>(const Context&, Position, bool, Optional<Position>);

bool is_sentence_punctuation(Codepoint c)
{
    static constexpr Codepoint punctuation[] = {
        '.', '!', '?',
        ';',    // also what normalization turns a greek question mark into
        0x00A1, // inverted exclamation mark
        0x00A7, // section sign
        0x00B6, // pilcrow
        0x00BF, // inverted question mark
        0x037E, // greek question mark
        0x055E, // armenian question mark
        0x059E, // hebrew accent gershayim
        0x3002, // ideographic full stop
    };
    return std::find(std::begin(punctuation), std::end(punctuation), c) != std::end(punctuation);
}

namespace
{

// Moves backward over the blanks preceding pos, so that a cursor sitting
// in the blanks after a sentence belongs to that sentence. Crossing an
// empty line, or reaching the previous sentence from another line, is
// only allowed when can_skip_to_previous is set.
Position to_before_blank(const Context& context, Position pos, bool can_skip_to_previous)
{
    auto& document = context.document();
    auto& classifier = context.classifier();

    bool jumped_over_blank_line = false;
    bool had_lf = true;
    auto [before_blank, reached_start] = skip_backward(document, pos, [&](Codepoint c) {
        if (c == '\n')
        {
            if (had_lf)
            {
                jumped_over_blank_line = true;
                return can_skip_to_previous;
            }
            had_lf = true;
            return true;
        }
        had_lf = false;
        return classifier.is_blank(c);
    });

    if (reached_start)
        return pos;

    const bool hit_punctuation = is_sentence_punctuation(char_at(document, before_blank));
    if (jumped_over_blank_line and (not can_skip_to_previous or not hit_punctuation))
        return pos;

    if (not hit_punctuation or can_skip_to_previous or pos.line == before_blank.line)
        return before_blank;

    return pos;
}

Position to_sentence_start(const Context& context, Position pos)
{
    auto& document = context.document();
    auto& classifier = context.classifier();
    const Position origin = pos;

    if (is_empty_line(document, pos.line) and pos.line + 1 >= document.line_count())
    {
        if (pos.line == 0)
            return {};
        pos = line_break(document, pos.line - 1);
    }

    if (is_empty_line(document, pos.line))
        return {pos.line + 1, first_non_blank_column(document, pos.line + 1)};

    bool first = true;
    bool had_lf = false;
    auto [stop, reached_start] = skip_backward(document, pos, [&](Codepoint c) {
        if (c == '\n')
        {
            first = false;
            if (had_lf)
                return false;
            had_lf = true;
            return true;
        }
        had_lf = false;
        // the character under the cursor may end the current sentence
        if (first)
        {
            first = false;
            return true;
        }
        return not is_sentence_punctuation(c);
    });

    const Position from = (had_lf or reached_start) ? stop : next_coord(document, stop);
    auto [start, reached_end] = skip_forward(document, from, [&](Codepoint c) {
        return classifier.is_blank(c);
    });
    return reached_end ? origin : start;
}

// Inclusive end of the sentence starting at from, nothing if it is empty
Optional<Position> sentence_inclusive_end(const Context& context, Position from, bool inner)
{
    auto& document = context.document();
    auto& classifier = context.classifier();

    if (is_empty_line(document, from.line))
    {
        if (from.line + 1 >= document.line_count() or is_empty_line(document, from.line + 1))
            return {};
        from = line_start(from.line + 1);
    }

    bool had_lf = false;
    auto [end, reached_end] = skip_forward(document, from, [&](Codepoint c) {
        if (c == '\n')
        {
            if (had_lf)
                return false;
            had_lf = true;
            return true;
        }
        had_lf = false;
        return not is_sentence_punctuation(c);
    });

    if (reached_end)
        return end;

    // ended by an empty line: the first line break belongs to the sentence
    if (had_lf)
    {
        const Position first_break = prev_coord(document, end);
        if (not inner)
            return first_break;
        if (first_break == from)
            return {};
        return prev_coord(document, first_break);
    }

    if (inner)
        return end;

    // outer sentence owns the blanks following its punctuation on that line
    auto line = document.line(end.line);
    CharCount column = end.column + 1;
    while (column < (int)line.size() and classifier.is_blank(line[(size_t)column]))
        ++column;
    if (column >= (int)line.size())
        return line_break(document, end.line);
    return Position{end.line, column - 1};
}

}

Selection select_sentence(const Context& context, Position pos, bool inner)
{
    const Position start = to_sentence_start(context, to_before_blank(context, pos, false));
    return {start, sentence_end(context, start, inner, start)};
}

Position sentence_start(const Context& context, Position pos, bool)
{
    return to_sentence_start(context, to_before_blank(context, pos, true));
}

Position sentence_end(const Context& context, Position pos, bool inner, Optional<Position> start)
{
    const Position from = start.value_or(pos);
    if (auto end = sentence_inclusive_end(context, from, inner))
        return selection_end(context, *end);
    return from;
}

namespace
{

Position to_paragraph_start(const Document& document, Position pos)
{
    LineCount line = pos.line;
    while (line >= 0 and is_empty_line(document, line))
        --line;
    if (line <= 0)
        return {};

    while (line > 0 and not is_empty_line(document, line - 1))
        --line;
    return line_start(line);
}

Position to_paragraph_inclusive_end(const Document& document, Position pos, bool inner)
{
    LineCount line = pos.line;
    while (line < document.line_count() and not is_empty_line(document, line))
        ++line;
    if (line >= document.line_count())
        return document_end(document);

    if (inner)
        return line_break(document, line > 0 ? line - 1 : line);

    while (line + 1 < document.line_count() and is_empty_line(document, line + 1))
        ++line;
    return line_break(document, line);
}

}

Selection select_paragraph(const Context& context, Position pos, bool inner)
{
    auto& document = context.document();
    // from an empty line, select the paragraph that follows it
    const Position start = pos.line + 1 < document.line_count() and
                           is_empty_line(document, pos.line) and
                           not is_empty_line(document, pos.line + 1)
        ? line_start(pos.line + 1) : to_paragraph_start(document, pos);
    return {start, selection_end(context, to_paragraph_inclusive_end(document, start, inner))};
}

Position paragraph_start(const Context& context, Position pos, bool)
{
    auto& document = context.document();
    if (pos.line > 0 and is_empty_line(document, pos.line))
        pos = line_start(pos.line - 1);
    return to_paragraph_start(document, pos);
}

Position paragraph_end(const Context& context, Position pos, bool inner, Optional<Position> start)
{
    return selection_end(context, to_paragraph_inclusive_end(context.document(), start.value_or(pos), inner));
}

namespace
{

Optional<std::pair<Position, Position>>
whitespace_run(const Context& context, Position pos, bool inner)
{
    auto& document = context.document();
    auto is_whitespace = [inner](Codepoint c) {
        return is_horizontal_blank(c) or (not inner and c == '\n');
    };
    if (not is_whitespace(char_at(document, pos)))
        return {};

    auto first = skip_backward(document, pos, is_whitespace);
    auto last = skip_forward(document, pos, is_whitespace);
    return std::pair{first.reached_edge ? first.pos : next_coord(document, first.pos),
                     last.reached_edge ? last.pos : prev_coord(document, last.pos)};
}

}

Selection select_whitespaces(const Context& context, Position pos, bool inner)
{
    if (auto run = whitespace_run(context, pos, inner))
        return {run->first, selection_end(context, run->second)};
    return pos;
}

Position whitespaces_start(const Context& context, Position pos, bool inner)
{
    if (auto run = whitespace_run(context, pos, inner))
        return run->first;
    return pos;
}

Position whitespaces_end(const Context& context, Position pos, bool inner, Optional<Position> start)
{
    if (auto run = whitespace_run(context, start.value_or(pos), inner))
        return selection_end(context, run->second);
    return pos;
}

namespace
{

// Line start (Backward) or inclusive line break (Forward) bounding the
// block of lines indented at least as much as reference. Empty lines
// never end a block.
Position to_indent_edge(const Document& document, Position from, bool inner,
                        Direction direction, Optional<CharCount> reference)
{
    const LineCount line_count = document.line_count();
    LineCount line = from.line;
    while (is_empty_line(document, line))
    {
        line += direction;
        if (line < 0)
            return {};
        if (line >= line_count)
            return document_end(document);
    }

    const CharCount indent = reference ? *reference : first_non_blank_column(document, line);
    LineCount last_non_blank_line = line;
    while (true)
    {
        line += direction;
        if (line < 0)
            return {};
        if (line >= line_count)
            return document_end(document);

        if (is_empty_line(document, line))
            continue;

        if (first_non_blank_column(document, line) < indent)
        {
            const LineCount result = inner ? last_non_blank_line : line - direction;
            return direction == Backward ? line_start(result) : line_break(document, result);
        }
        last_non_blank_line = line;
    }
}

// Indent of the first non empty line at or around line, 0 if there is none
CharCount reference_indent(const Document& document, LineCount line)
{
    for (LineCount l = line; l >= 0; --l)
    {
        if (not is_empty_line(document, l))
            return first_non_blank_column(document, l);
    }
    for (LineCount l = line + 1; l < document.line_count(); ++l)
    {
        if (not is_empty_line(document, l))
            return first_non_blank_column(document, l);
    }
    return 0;
}

}

Selection select_indent(const Context& context, Position pos, bool inner)
{
    auto& document = context.document();
    const CharCount reference = reference_indent(document, pos.line);
    const Position start = to_indent_edge(document, pos, inner, Backward, reference);
    return {start, selection_end(context, to_indent_edge(document, start, inner, Forward, reference))};
}

Position indent_start(const Context& context, Position pos, bool inner)
{
    return to_indent_edge(context.document(), pos, inner, Backward, {});
}

Position indent_end(const Context& context, Position pos, bool inner, Optional<Position> start)
{
    return selection_end(context, to_indent_edge(context.document(), start.value_or(pos),
                                                 inner, Forward, {}));
}

namespace
{

struct ArgumentBounds
{
    Position outer_start;
    Position inner_start;
    // inclusive, nothing when the argument is empty
    Optional<Position> outer_end;
    Optional<Position> inner_end;
};

// Scans in direction for the delimiter ending an argument: the closing
// bracket of the enclosing list, or a separating comma when commas_split
// is set. Nested parentheses and brackets are skipped.
ScanResult scan_to_argument_delimiter(const Document& document, Position from,
                                      Direction direction, bool commas_split)
{
    const Codepoint opening_paren   = direction == Forward ? '(' : ')';
    const Codepoint closing_paren   = direction == Forward ? ')' : '(';
    const Codepoint opening_bracket = direction == Forward ? '[' : ']';
    const Codepoint closing_bracket = direction == Forward ? ']' : '[';

    int paren_depth = 0;
    int bracket_depth = 0;
    return skip(document, from, direction, [&](Codepoint c) {
        const bool balanced = paren_depth == 0 and bracket_depth == 0;
        if (c == closing_paren or c == closing_bracket)
        {
            if (balanced)
                return false;
            --(c == closing_paren ? paren_depth : bracket_depth);
        }
        else if (c == opening_paren)
            ++paren_depth;
        else if (c == opening_bracket)
            ++bracket_depth;
        else if (c == ',' and balanced and commas_split)
            return false;
        return true;
    });
}

ArgumentBounds argument_bounds(const Context& context, Position pos)
{
    auto& document = context.document();
    auto& classifier = context.classifier();
    const auto before = offset_coord(document, pos, Backward);

    // commas separate arguments of parenthesized lists only
    bool commas_split = true;
    if (before)
    {
        int depth = 0;
        skip_backward(document, *before, [&](Codepoint c) {
            if (c == ')' or c == ']')
                ++depth;
            else if (c == '(' or c == '[')
            {
                if (depth == 0)
                {
                    commas_split = c == '(';
                    return false;
                }
                --depth;
            }
            return true;
        });
    }

    ArgumentBounds bounds;
    if (before)
    {
        auto opening = scan_to_argument_delimiter(document, *before, Backward, commas_split);
        bounds.outer_start = opening.reached_edge ? opening.pos : next_coord(document, opening.pos);
    }

    auto closing = scan_to_argument_delimiter(document, pos, Forward, commas_split);
    // a delimiter or the document end right at the start leaves it empty
    if (closing.pos != bounds.outer_start)
    {
        if (closing.reached_edge)
            bounds.outer_end = bounds.inner_end = closing.pos;
        else
        {
            bounds.inner_end = prev_coord(document, closing.pos);
            // a trailing comma belongs to the outer argument
            bounds.outer_end = char_at(document, closing.pos) == ',' ? closing.pos : *bounds.inner_end;
        }
    }

    bounds.inner_start = bounds.outer_start;
    if (not bounds.inner_end)
        return bounds;

    Position first = bounds.outer_start;
    Position last = *bounds.inner_end;
    while (first < last and classifier.is_blank(char_at(document, first)))
        first = next_coord(document, first);
    while (last > first and classifier.is_blank(char_at(document, last)))
        last = prev_coord(document, last);

    if (classifier.is_blank(char_at(document, first)))
        bounds.inner_end.reset();
    else
    {
        bounds.inner_start = first;
        bounds.inner_end = last;
    }
    return bounds;
}

}

Selection select_argument(const Context& context, Position pos, bool inner)
{
    const auto bounds = argument_bounds(context, pos);
    const Position start = inner ? bounds.inner_start : bounds.outer_start;
    const auto& end = inner ? bounds.inner_end : bounds.outer_end;
    return {start, end ? selection_end(context, *end) : start};
}

Position argument_start(const Context& context, Position pos, bool inner)
{
    const auto bounds = argument_bounds(context, pos);
    return inner ? bounds.inner_start : bounds.outer_start;
}

Position argument_end(const Context& context, Position pos, bool inner, Optional<Position>)
{
    return select_argument(context, pos, inner).active();
}

UnitTest test_word_boundary{[]()
{
    GlobalScope global;
    Scope character_scope{global};
    character_scope.options().get_local_option("selection_behavior").set(SelectionBehavior::Character);

    {
        StringDocument doc{"foo bar"};
        Context context{doc, global.options()};
        ts_assert(*word_boundary(context, Forward, {0, 0}, true) == Selection({0, 0}, {0, 3}));
        ts_assert(*word_boundary(context, Forward, {0, 0}, false) == Selection({0, 0}, {0, 4}));
        ts_assert(*word_boundary(context, Forward, {0, 3}, true) == Selection({0, 3}, {0, 7}));
        ts_assert(*word_boundary(context, Backward, {0, 3}, true) == Selection({0, 3}, {0, 0}));
        ts_assert(not word_boundary(context, Forward, {0, 7}, true));
        ts_assert(not word_boundary(context, Backward, {0, 1}, false));
    }
    {
        StringDocument doc{"foo\n\nbar"};
        Context context{doc, global.options()};
        ts_assert(*word_boundary(context, Forward, {0, 3}, true) == Selection({2, 0}, {2, 3}));
        ts_assert(*word_boundary(context, Backward, {2, 0}, true) == Selection({0, 3}, {0, 0}));
    }
    {
        StringDocument doc{""};
        Context context{doc, global.options()};
        ts_assert(not word_boundary(context, Forward, {0, 0}, true));
        ts_assert(not word_boundary(context, Backward, {0, 0}, false));
    }
    {
        StringDocument doc{"ab  cd"};
        Context context{doc, character_scope.options()};
        ts_assert(*word_boundary(context, Forward, {0, 1}, false) == Selection({0, 2}, {0, 4}));
        ts_assert(not word_boundary(context, Forward, {0, 5}, true));
    }
    {
        StringDocument doc{"foo-bar baz"};
        Context context{doc, global.options()};
        ts_assert(*word_boundary(context, Forward, {0, 0}, true) == Selection({0, 0}, {0, 3}));
        ts_assert(*word_boundary(context, Forward, {0, 0}, true, CharSet::NonBlank) == Selection({0, 0}, {0, 7}));
    }

    // seeking back from a forward seek lands on or before where it started
    StringDocument doc{"foo bar, baz\n\n  qux-quux  "};
    Context context{doc, global.options()};
    for (LineCount line = 0; line < doc.line_count(); ++line)
    {
        for (CharCount column = 0; column <= doc.line_length(line); ++column)
        {
            for (bool stop_at_end : { true, false })
            {
                auto forward = word_boundary(context, Forward, {line, column}, stop_at_end);
                if (not forward)
                    continue;
                if (auto backward = word_boundary(context, Backward, forward->active(), stop_at_end))
                    ts_assert(backward->active() <= forward->anchor());
            }
        }
    }
}};

UnitTest test_word_object{[]()
{
    GlobalScope global;
    StringDocument doc{"foo-bar  baz"};
    Context context{doc, global.options()};

    ts_assert(select_word<WordType::Word>(context, {0, 1}, true) == Selection({0, 0}, {0, 3}));
    ts_assert(select_word<WordType::WORD>(context, {0, 1}, true) == Selection({0, 0}, {0, 7}));
    ts_assert(select_word<WordType::WORD>(context, {0, 1}, false) == Selection({0, 0}, {0, 9}));
    ts_assert(word_start<WordType::Word>(context, {0, 5}, true) == Position{0, 4});
    ts_assert(word_end<WordType::Word>(context, {0, 10}, false) == Position{0, 12});
    ts_assert(select_word<WordType::Word>(context, {0, 12}, true) == Selection({0, 12}, {0, 12}));
}};

UnitTest test_sentence{[]()
{
    GlobalScope global;
    Scope character_scope{global};
    character_scope.options().get_local_option("selection_behavior").set(SelectionBehavior::Character);

    {
        StringDocument doc{"foo.\n  bar"};
        Context context{doc, global.options()};
        ts_assert(select_sentence(context, {0, 0}, true) == Selection({0, 0}, {0, 4}));
        ts_assert(select_sentence(context, {0, 0}, false) == Selection({0, 0}, {1, 0}));
        ts_assert(select_sentence(context, {1, 2}, true) == Selection({1, 2}, {1, 5}));
        ts_assert(sentence_start(context, {1, 4}, true) == Position{1, 2});

        Context char_context{doc, character_scope.options()};
        ts_assert(select_sentence(char_context, {0, 0}, true) == Selection({0, 0}, {0, 3}));
        ts_assert(select_sentence(char_context, {0, 0}, false) == Selection({0, 0}, {0, 4}));
        ts_assert(select_sentence(char_context, {1, 2}, true) == Selection({1, 2}, {1, 4}));
    }
    {
        StringDocument doc{"foo. bar"};
        Context context{doc, global.options()};
        ts_assert(sentence_start(context, {0, 5}, true) == Position{0, 5});
        // from the blank between sentences, seeking the start jumps back
        ts_assert(sentence_start(context, {0, 4}, true) == Position{0, 0});
        ts_assert(select_sentence(context, {0, 4}, false) == Selection({0, 0}, {0, 5}));
    }
    {
        StringDocument doc{"foo\n\nbar"};
        Context context{doc, global.options()};
        ts_assert(select_sentence(context, {0, 1}, true) == Selection({0, 0}, {0, 3}));
        ts_assert(select_sentence(context, {0, 1}, false) == Selection({0, 0}, {1, 0}));
        ts_assert(select_sentence(context, {2, 1}, true) == Selection({2, 0}, {2, 3}));
    }
    {
        StringDocument doc{"a.\n\n\nb"};
        Context context{doc, global.options()};
        ts_assert(sentence_end(context, {1, 0}, true) == Position{1, 0});
        ts_assert(sentence_end(context, {2, 0}, true) == Position{3, 1});
    }
    {
        // only blanks after the last sentence: the start stays on the cursor
        StringDocument doc{"a.\n  "};
        Context context{doc, global.options()};
        ts_assert(select_sentence(context, {1, 2}, true) == Selection({1, 2}, {1, 2}));
    }
    {
        StringDocument doc{""};
        Context context{doc, global.options()};
        ts_assert(select_sentence(context, {0, 0}, true) == Selection({0, 0}, {0, 0}));
        ts_assert(select_sentence(context, {0, 0}, false) == Selection({0, 0}, {0, 0}));
    }

    const Codepoint punctuation_chars[] = { '.', '!', '?', ';', 0x00A1, 0x00A7, 0x00B6, 0x00BF,
                                            0x037E, 0x055E, 0x059E, 0x3002 };
    for (Codepoint punctuation : punctuation_chars)
    {
        ts_assert(is_sentence_punctuation(punctuation));
        StringDocument doc{"a"_sv + String{punctuation} + " b"};
        Context context{doc, global.options()};
        ts_assert(select_sentence(context, {0, 0}, true) == Selection({0, 0}, {0, 2}));
        ts_assert(select_sentence(context, {0, 0}, false) == Selection({0, 0}, {0, 3}));
    }
    ts_assert(not is_sentence_punctuation(','));
    ts_assert(not is_sentence_punctuation(':'));
    ts_assert(not is_sentence_punctuation(0x0589)); // armenian full stop

    StringDocument doc{"a, b"};
    Context context{doc, global.options()};
    ts_assert(select_sentence(context, {0, 0}, true) == Selection({0, 0}, {0, 4}));
}};

UnitTest test_paragraph{[]()
{
    GlobalScope global;
    Scope character_scope{global};
    character_scope.options().get_local_option("selection_behavior").set(SelectionBehavior::Character);

    {
        StringDocument doc{"a\n\nb"};
        Context context{doc, global.options()};
        ts_assert(select_paragraph(context, {1, 0}, true) == Selection({2, 0}, {2, 1}));
        ts_assert(select_paragraph(context, {1, 0}, false) == Selection({2, 0}, {2, 1}));
        Context char_context{doc, character_scope.options()};
        ts_assert(select_paragraph(char_context, {1, 0}, true) == Selection({2, 0}, {2, 0}));
    }

    StringDocument doc{"a\nb\n\n\nc"};
    Context context{doc, global.options()};
    ts_assert(select_paragraph(context, {0, 0}, true) == Selection({0, 0}, {2, 0}));
    ts_assert(select_paragraph(context, {1, 1}, false) == Selection({0, 0}, {4, 0}));
    ts_assert(select_paragraph(context, {4, 0}, true) == Selection({4, 0}, {4, 1}));
    ts_assert(paragraph_start(context, {4, 0}, true) == Position{4, 0});
    ts_assert(paragraph_start(context, {3, 0}, true) == Position{0, 0});
    ts_assert(paragraph_end(context, {1, 0}, true) == Position{2, 0});
    ts_assert(paragraph_end(context, {4, 0}, true, Position{0, 0}) == Position{2, 0});

    StringDocument empty{""};
    Context empty_context{empty, global.options()};
    ts_assert(select_paragraph(empty_context, {0, 0}, false) == Selection({0, 0}, {0, 0}));
}};

UnitTest test_whitespaces{[]()
{
    GlobalScope global;
    StringDocument doc{"a  \n  b"};
    Context context{doc, global.options()};

    ts_assert(select_whitespaces(context, {0, 1}, true) == Selection({0, 1}, {0, 3}));
    ts_assert(select_whitespaces(context, {0, 1}, false) == Selection({0, 1}, {1, 2}));
    ts_assert(select_whitespaces(context, {0, 0}, false) == Selection({0, 0}, {0, 0}));
    ts_assert(whitespaces_start(context, {1, 1}, false) == Position{0, 1});
    ts_assert(whitespaces_start(context, {1, 1}, true) == Position{1, 0});
    ts_assert(whitespaces_end(context, {0, 2}, true) == Position{0, 3});
}};

UnitTest test_indent{[]()
{
    GlobalScope global;
    {
        StringDocument doc{"a\n  b\n  c\nd"};
        Context context{doc, global.options()};
        ts_assert(select_indent(context, {1, 2}, false) == Selection({1, 0}, {3, 0}));
        ts_assert(select_indent(context, {1, 2}, true) == Selection({1, 0}, {3, 0}));
        ts_assert(indent_start(context, {2, 1}, true) == Position{1, 0});
        ts_assert(indent_end(context, {1, 0}, true) == Position{3, 0});
    }
    {
        // empty lines inside the block are part of it
        StringDocument doc{"a\n  b\n\n  c\nd"};
        Context context{doc, global.options()};
        ts_assert(select_indent(context, {1, 2}, true) == Selection({1, 0}, {4, 0}));
        ts_assert(select_indent(context, {2, 0}, true) == Selection({1, 0}, {4, 0}));
        ts_assert(select_indent(context, {1, 2}, false) == Selection({1, 0}, {4, 0}));
    }
    {
        StringDocument doc{"a\n  b\n\nc"};
        Context context{doc, global.options()};
        ts_assert(select_indent(context, {1, 2}, true) == Selection({1, 0}, {2, 0}));
        ts_assert(select_indent(context, {1, 2}, false) == Selection({1, 0}, {3, 0}));
    }
    {
        StringDocument doc{"  a\n  b"};
        Context context{doc, global.options()};
        ts_assert(select_indent(context, {1, 0}, true) == Selection({0, 0}, {1, 3}));
    }
    StringDocument empty{""};
    Context context{empty, global.options()};
    ts_assert(select_indent(context, {0, 0}, true) == Selection({0, 0}, {0, 0}));
}};

UnitTest test_argument{[]()
{
    GlobalScope global;
    Scope character_scope{global};
    character_scope.options().get_local_option("selection_behavior").set(SelectionBehavior::Character);

    StringDocument doc{"f(a, [b,c], d)"};
    Context context{doc, global.options()};
    ts_assert(select_argument(context, {0, 6}, true) == Selection({0, 6}, {0, 9}));
    ts_assert(select_argument(context, {0, 12}, true) == Selection({0, 12}, {0, 13}));
    ts_assert(select_argument(context, {0, 12}, false) == Selection({0, 11}, {0, 13}));
    ts_assert(argument_start(context, {0, 12}, false) == Position{0, 11});
    ts_assert(select_argument(context, {0, 2}, false) == Selection({0, 2}, {0, 4}));
    ts_assert(select_argument(context, {0, 2}, true) == Selection({0, 2}, {0, 3}));
    ts_assert(argument_start(context, {0, 11}, true) == Position{0, 12});
    ts_assert(argument_end(context, {0, 2}, false) == Position{0, 4});

    Context char_context{doc, character_scope.options()};
    ts_assert(select_argument(char_context, {0, 6}, true) == Selection({0, 6}, {0, 8}));

    StringDocument empty_list{"f()"};
    Context empty_context{empty_list, global.options()};
    ts_assert(select_argument(empty_context, {0, 2}, false) == Selection({0, 2}, {0, 2}));
    Context empty_char_context{empty_list, character_scope.options()};
    ts_assert(select_argument(empty_char_context, {0, 2}, true) == Selection({0, 2}, {0, 2}));

    {
        // cursor on the document end right after a separator
        StringDocument doc{".), ;,"};
        Context char_context{doc, character_scope.options()};
        ts_assert(select_argument(char_context, {0, 6}, false) == Selection({0, 6}, {0, 6}));
        ts_assert(select_argument(char_context, {0, 6}, true) == Selection({0, 6}, {0, 6}));
        Context context{doc, global.options()};
        ts_assert(select_argument(context, {0, 6}, false) == Selection({0, 6}, {0, 6}));
    }

    StringDocument blank_arg{"g(a,  )"};
    Context blank_context{blank_arg, global.options()};
    ts_assert(select_argument(blank_context, {0, 5}, true) == Selection({0, 4}, {0, 4}));
    ts_assert(select_argument(blank_context, {0, 5}, false) == Selection({0, 4}, {0, 6}));
}};

UnitTest test_object_ordering{[]()
{
    GlobalScope global;
    Scope character_scope{global};
    character_scope.options().get_local_option("selection_behavior").set(SelectionBehavior::Character);

    const char* texts[] = {
        "def f(a, [b, c]):\n    return g(a,\n             b)\n\n\nclass A:\n  x = 1. y = 2\n",
        "\n\n  foo bar.\n\tbaz!  qux\n\n",
        ".), ;,",
        "f(a, ",
        "",
    };
    for (auto text : texts)
    {
        StringDocument doc{text};
        for (const OptionManager* options : { &global.options(), &character_scope.options() })
        {
            Context context{doc, *options};
            for (LineCount line = 0; line < doc.line_count(); ++line)
            {
                for (CharCount column = 0; column <= doc.line_length(line); ++column)
                {
                    for (auto select : { select_paragraph, select_indent, select_argument })
                    {
                        const Selection outer = select(context, {line, column}, false);
                        const Selection inner = select(context, {line, column}, true);
                        ts_assert(outer.anchor() <= inner.anchor());
                        ts_assert(inner.anchor() <= inner.active());
                        ts_assert(inner.active() <= outer.active());
                    }
                }
            }
        }
    }
}};

}
