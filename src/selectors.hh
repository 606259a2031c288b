#ifndef selectors_hh_INCLUDED
#define selectors_hh_INCLUDED

#include "char_classifier.hh"
#include "coord.hh"
#include "optional.hh"
#include "selection.hh"

namespace TextSeek
{

class Context;

enum class WordType { Word, WORD };

// Selects the next word (or previous one when direction is Backward)
// from origin. When origin sits on a line boundary, the search continues
// on the first non empty line in direction, and gives nothing if there
// is none. When stop_at_end is set, the active end stops at the end of
// the word instead of after its trailing blanks.
Optional<Selection>
word_boundary(const Context& context, Direction direction, Position origin,
              bool stop_at_end, CharSet word_set = CharSet::Word);

bool is_sentence_punctuation(Codepoint c);

// Object seeks: select_* gives the whole object around pos, *_start and
// *_end the object bound on one side, end seeks reuse start when known.
// Ends follow the context selection behavior: past the last character
// in Caret mode, on it in Character mode.

template<WordType word_type>
Selection select_word(const Context& context, Position pos, bool inner);
template<WordType word_type>
Position word_start(const Context& context, Position pos, bool inner);
template<WordType word_type>
Position word_end(const Context& context, Position pos, bool inner,
                  Optional<Position> start = {});

Selection select_sentence(const Context& context, Position pos, bool inner);
Position sentence_start(const Context& context, Position pos, bool inner);
Position sentence_end(const Context& context, Position pos, bool inner,
                      Optional<Position> start = {});

Selection select_paragraph(const Context& context, Position pos, bool inner);
Position paragraph_start(const Context& context, Position pos, bool inner);
Position paragraph_end(const Context& context, Position pos, bool inner,
                       Optional<Position> start = {});

Selection select_whitespaces(const Context& context, Position pos, bool inner);
Position whitespaces_start(const Context& context, Position pos, bool inner);
Position whitespaces_end(const Context& context, Position pos, bool inner,
                         Optional<Position> start = {});

Selection select_indent(const Context& context, Position pos, bool inner);
Position indent_start(const Context& context, Position pos, bool inner);
Position indent_end(const Context& context, Position pos, bool inner,
                    Optional<Position> start = {});

Selection select_argument(const Context& context, Position pos, bool inner);
Position argument_start(const Context& context, Position pos, bool inner);
Position argument_end(const Context& context, Position pos, bool inner,
                      Optional<Position> start = {});

}

#endif // selectors_hh_INCLUDED
