#include "context.hh"

#include "document.hh"
#include "option_types.hh"
#include "scope.hh"
#include "unit_tests.hh"

namespace TextSeek
{

Context::Context(const Document& document, const OptionManager& options)
    : m_document(document), m_options(options),
      m_classifier(options["extra_word_chars"].get<Vector<Codepoint>>()),
      m_selection_behavior(options["selection_behavior"].get<SelectionBehavior>())
{
}

Context::Context(const Document& document, const OptionManager& options,
                 CharClassifier classifier)
    : m_document(document), m_options(options),
      m_classifier(std::move(classifier)),
      m_selection_behavior(options["selection_behavior"].get<SelectionBehavior>())
{
}

UnitTest test_context{[]()
{
    GlobalScope global;
    Scope scope{global};
    StringDocument doc{"foo-bar"};

    Context context{doc, scope.options()};
    ts_assert(&context.document() == &doc);
    ts_assert(context.selection_behavior() == SelectionBehavior::Caret);
    ts_assert(context.classifier().is_punctuation('-'));

    const String dash[] = { "-" };
    scope.options().get_local_option("extra_word_chars").set_from_strings(dash);
    global.options()["selection_behavior"].set(SelectionBehavior::Character);
    // option changes are seen by contexts built afterwards only
    ts_assert(context.classifier().is_punctuation('-'));
    ts_assert(context.selection_behavior() == SelectionBehavior::Caret);

    Context updated{doc, scope.options()};
    ts_assert(updated.classifier().is_word('-'));
    ts_assert(updated.classifier().is_punctuation('_'));
    ts_assert(updated.selection_behavior() == SelectionBehavior::Character);

    Context digits{doc, scope.options(), CharClassifier{[](Codepoint c) { return is_basic_digit(c); }}};
    ts_assert(digits.classifier().is_punctuation('f'));
    ts_assert(digits.classifier().is_word('7'));
    ts_assert(digits.selection_behavior() == SelectionBehavior::Character);
}};

}
