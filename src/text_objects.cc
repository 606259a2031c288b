#include "text_objects.hh"

#include "context.hh"
#include "debug.hh"
#include "document.hh"
#include "exception.hh"
#include "format.hh"
#include "option_types.hh"
#include "scope.hh"
#include "selectors.hh"
#include "unit_tests.hh"

#include <algorithm>
#include <iterator>

namespace TextSeek
{

const ObjectDesc& object_desc(ObjectKind kind)
{
    static constexpr struct ObjectEntry
    {
        ObjectKind kind;
        ObjectDesc desc;
    } objects[] = {
        { ObjectKind::Word, { select_word<WordType::Word>, word_start<WordType::Word>, word_end<WordType::Word> } },
        { ObjectKind::WORD, { select_word<WordType::WORD>, word_start<WordType::WORD>, word_end<WordType::WORD> } },
        { ObjectKind::Sentence, { select_sentence, sentence_start, sentence_end } },
        { ObjectKind::Paragraph, { select_paragraph, paragraph_start, paragraph_end } },
        { ObjectKind::Whitespaces, { select_whitespaces, whitespaces_start, whitespaces_end } },
        { ObjectKind::Indent, { select_indent, indent_start, indent_end } },
        { ObjectKind::Argument, { select_argument, argument_start, argument_end } },
    };
    auto it = std::find_if(std::begin(objects), std::end(objects),
                           [kind](const ObjectEntry& entry) { return entry.kind == kind; });
    if (it == std::end(objects))
        throw contract_violation(format("no such object kind: {}", (int)kind));
    return it->desc;
}

Optional<ObjectKind> object_kind_from_name(StringView name)
{
    for (auto& desc : enum_desc(Meta::Type<ObjectKind>{}))
    {
        if (desc.name == name)
            return desc.value;
    }
    return {};
}

Selection select_object(const Context& context, Position pos,
                        ObjectKind kind, ObjectFlags flags)
{
    const ObjectDesc& desc = object_desc(kind);
    const bool inner = flags & ObjectFlags::Inner;

    Selection result;
    if (flags & ObjectFlags::ToBegin and flags & ObjectFlags::ToEnd)
        result = desc.select(context, pos, inner);
    else if (flags & ObjectFlags::ToBegin)
        result = {pos, desc.start(context, pos, inner)};
    else if (flags & ObjectFlags::ToEnd)
        result = {pos, desc.end(context, pos, inner, {})};
    else
        throw contract_violation("object selection needs a side to select to");

    if (context.options()["debug"].get<DebugFlags>() & DebugFlags::Seeks)
        write_to_debug_log(format("{}{} at {}:{} selected {}:{} -> {}:{}",
                                  inner ? "inner " : "", enum_name(kind),
                                  pos.line, pos.column,
                                  result.anchor().line, result.anchor().column,
                                  result.active().line, result.active().column));
    return result;
}

UnitTest test_text_objects{[]()
{
    static String seek_log;
    ts_assert(object_kind_from_name("WORD") == ObjectKind::WORD);
    ts_assert(object_kind_from_name("whitespaces") == ObjectKind::Whitespaces);
    ts_assert(not object_kind_from_name("number"));
    ts_assert(object_desc(ObjectKind::Paragraph).start == paragraph_start);

    GlobalScope global;
    StringDocument doc{"f(a, [b,c], d)\n\nnext one."};
    Context context{doc, global.options()};

    const auto whole = ObjectFlags::ToBegin | ObjectFlags::ToEnd;
    ts_assert(select_object(context, {0, 6}, ObjectKind::Argument, whole | ObjectFlags::Inner) ==
              Selection({0, 6}, {0, 9}));
    ts_assert(select_object(context, {0, 12}, ObjectKind::Argument, whole) ==
              Selection({0, 11}, {0, 13}));
    ts_assert(select_object(context, {0, 7}, ObjectKind::Argument, ObjectFlags::ToEnd | ObjectFlags::Inner) ==
              Selection({0, 7}, {0, 9}));
    ts_assert(select_object(context, {2, 6}, ObjectKind::Word, ObjectFlags::ToBegin) ==
              Selection({2, 6}, {2, 5}));
    ts_assert(select_object(context, {2, 1}, ObjectKind::Paragraph, whole) ==
              Selection({2, 0}, {2, 9}));
    ts_assert(select_object(context, {0, 3}, ObjectKind::Whitespaces, ObjectFlags::ToEnd) ==
              Selection({0, 3}, {0, 3}));
    ts_expect_throw(contract_violation, select_object(context, {0, 0}, ObjectKind::Word, ObjectFlags::Inner));

    set_debug_log_sink([](StringView message) { seek_log = message.str(); });
    global.options()["debug"].set(DebugFlags::Seeks);
    select_object(context, {2, 1}, ObjectKind::Word, whole | ObjectFlags::Inner);
    set_debug_log_sink(nullptr);
    ts_assert(seek_log == "inner word at 2:1 selected 2:0 -> 2:4");
}};

}
