#ifndef text_objects_hh_INCLUDED
#define text_objects_hh_INCLUDED

#include "coord.hh"
#include "enum.hh"
#include "flags.hh"
#include "optional.hh"
#include "selection.hh"

namespace TextSeek
{

class Context;

enum class ObjectKind
{
    Word,
    WORD,
    Sentence,
    Paragraph,
    Whitespaces,
    Indent,
    Argument,
};

constexpr auto enum_desc(Meta::Type<ObjectKind>)
{
    return make_array<EnumDesc<ObjectKind>>({
        { ObjectKind::Word, "word" },
        { ObjectKind::WORD, "WORD" },
        { ObjectKind::Sentence, "sentence" },
        { ObjectKind::Paragraph, "paragraph" },
        { ObjectKind::Whitespaces, "whitespaces" },
        { ObjectKind::Indent, "indent" },
        { ObjectKind::Argument, "argument" },
    });
}

enum class ObjectFlags
{
    ToBegin = 1 << 0,
    ToEnd   = 1 << 1,
    Inner   = 1 << 2,
};

constexpr bool with_bit_ops(Meta::Type<ObjectFlags>) { return true; }

struct ObjectDesc
{
    Selection (*select)(const Context& context, Position pos, bool inner);
    Position (*start)(const Context& context, Position pos, bool inner);
    Position (*end)(const Context& context, Position pos, bool inner, Optional<Position> start);
};

const ObjectDesc& object_desc(ObjectKind kind);

Optional<ObjectKind> object_kind_from_name(StringView name);

// ToBegin | ToEnd selects the whole object around pos, a single side
// flag selects from pos to that object bound.
Selection select_object(const Context& context, Position pos,
                        ObjectKind kind, ObjectFlags flags);

}

#endif // text_objects_hh_INCLUDED
