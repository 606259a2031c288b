#include "scope.hh"

#include "debug.hh"
#include "option_types.hh"
#include "selection.hh"
#include "unit_tests.hh"

namespace TextSeek
{

GlobalScope::GlobalScope()
    : m_option_registry(options())
{
    register_options(m_option_registry);
}

static void check_extra_word_chars(const Vector<Codepoint>& extra_chars)
{
    if (std::any_of(extra_chars.begin(), extra_chars.end(),
                    [](Codepoint c) { return c == 0 or is_blank(c); }))
        throw runtime_error{"blanks are not accepted for extra word characters"};
}

void register_options(OptionsRegistry& reg)
{
    reg.declare_option<Vector<Codepoint>, check_extra_word_chars>(
        "extra_word_chars",
        "Additional characters to be considered as words",
        { '_' });
    reg.declare_option(
        "selection_behavior",
        "caret: positions are between characters, "
        "character: positions are on characters",
        SelectionBehavior::Caret);
    reg.declare_option("debug", "various debug flags", DebugFlags::None);
}

UnitTest test_options{[]()
{
    GlobalScope global;
    Scope python{global};
    Scope lisp{python};

    auto& globals = global.options();
    ts_assert(globals["extra_word_chars"].get<Vector<Codepoint>>() == Vector<Codepoint>{'_'});
    ts_assert(globals["selection_behavior"].get<SelectionBehavior>() == SelectionBehavior::Caret);
    ts_assert(globals["debug"].get<DebugFlags>() == DebugFlags::None);
    ts_assert(globals["selection_behavior"].get_as_string() == "caret");
    ts_assert(global.option_registry().option_exists("extra_word_chars"));
    ts_assert(global.option_registry().option_desc("debug")->docstring() ==
              "[flags(options|seeks)] - various debug flags");

    const String lisp_chars[] = { "-", "?", "_" };
    lisp.options().get_local_option("extra_word_chars").set_from_strings(lisp_chars);
    ts_assert(lisp.options()["extra_word_chars"].get<Vector<Codepoint>>() ==
              Vector<Codepoint>{'-', '?', '_'});
    ts_assert(lisp.options()["extra_word_chars"].get_as_string() == "- ? _");
    ts_assert(python.options()["extra_word_chars"].get<Vector<Codepoint>>() == Vector<Codepoint>{'_'});

    python.options().get_local_option("selection_behavior").set(SelectionBehavior::Character);
    ts_assert(lisp.options()["selection_behavior"].get<SelectionBehavior>() == SelectionBehavior::Character);
    ts_assert(globals["selection_behavior"].get<SelectionBehavior>() == SelectionBehavior::Caret);
    python.options().unset_option("selection_behavior");
    ts_assert(lisp.options()["selection_behavior"].get<SelectionBehavior>() == SelectionBehavior::Caret);

    const String flags[] = { "options|seeks" };
    globals["debug"].set_from_strings(flags);
    ts_assert(globals["debug"].get<DebugFlags>() == (DebugFlags::Options | DebugFlags::Seeks));
    ts_assert(globals["debug"].get_as_string() == "options|seeks");

    const String bad_behavior[] = { "block" };
    ts_expect_throw(runtime_error, globals["selection_behavior"].set_from_strings(bad_behavior));
    const String bad_flag[] = { "options|hooks" };
    ts_expect_throw(runtime_error, globals["debug"].set_from_strings(bad_flag));
    const String two_chars[] = { "ab" };
    ts_expect_throw(runtime_error, globals["extra_word_chars"].set_from_strings(two_chars));
    const String space[] = { " " };
    ts_expect_throw(runtime_error, globals["extra_word_chars"].set_from_strings(space));
    ts_expect_throw(runtime_error, globals["selection_behavior"].get<int>());
    ts_expect_throw(runtime_error, globals["tabstop"]);
    ts_expect_throw(runtime_error, globals.unset_option("debug"));
    ts_expect_throw(runtime_error, global.option_registry().declare_option("debug", "", 0));
    ts_expect_throw(runtime_error, global.option_registry().declare_option("bad-name", "", 0));
}};

UnitTest test_option_watchers{[]()
{
    struct Watcher : OptionManagerWatcher
    {
        void on_option_changed(const Option& option) override { changed.push_back(option.name()); }
        Vector<String> changed;
    };

    GlobalScope global;
    Scope child{global};
    Watcher watcher;
    child.options().register_watcher(watcher);

    global.options()["selection_behavior"].set(SelectionBehavior::Character);
    ts_assert(watcher.changed.size() == 1 and watcher.changed[0] == "selection_behavior");

    child.options().get_local_option("debug").set(DebugFlags::Options);
    ts_assert(watcher.changed.size() == 2);

    // overridden in child, changes at the global scope are not seen
    global.options()["debug"].set(DebugFlags::Seeks);
    ts_assert(watcher.changed.size() == 2);

    child.options().unset_option("debug");
    ts_assert(watcher.changed.size() == 3 and watcher.changed[2] == "debug");

    child.options().unregister_watcher(watcher);
}};

UnitTest test_option_change_log{[]()
{
    static Vector<String> messages;
    set_debug_log_sink([](StringView message) { messages.push_back(message.str()); });

    GlobalScope global;
    Scope child{global};
    global.options()["selection_behavior"].set(SelectionBehavior::Character);
    global.options()["debug"].set(DebugFlags::Options);
    child.options().get_local_option("selection_behavior").set(SelectionBehavior::Caret);
    set_debug_log_sink(nullptr);

    // logged once, by the scope the option was set at
    ts_assert(messages.size() == 2);
    ts_assert(messages[0] == "option 'debug' changed to 'options'");
    ts_assert(messages[1] == "option 'selection_behavior' changed to 'caret'");
}};

}
