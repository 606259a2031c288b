#include "char_classifier.hh"

#include "debug.hh"
#include "exception.hh"
#include "format.hh"
#include "unit_tests.hh"

namespace TextSeek
{

CharClassifier::CharClassifier(ConstArrayView<Codepoint> extra_word_chars)
    : m_extra_word_chars(extra_word_chars.begin(), extra_word_chars.end())
{
    check_word_class();
}

CharClassifier::CharClassifier(WordPredicate is_word)
    : m_is_word(is_word)
{
    if (not m_is_word)
        throw contract_violation{"word predicate is null"};
    check_word_class();
}

void CharClassifier::check_word_class() const
{
    static constexpr Codepoint never_words[] = {
        0, '\n', '\r', '\t', '\v', '\f', ' ',
        U'\u00A0', U'\u1680', U'\u2000', U'\u2003', U'\u2009',
        U'\u200A', U'\u2028', U'\u202F', U'\u3000', U'\uFEFF'
    };

    auto reject = [](Codepoint c) {
        auto message = format("codepoint {} cannot be a word character", hex(c));
        write_to_debug_log(format("char classifier: {}", message));
        throw contract_violation{std::move(message)};
    };

    for (auto c : never_words)
    {
        if (is_word(c))
            reject(c);
    }
    for (auto c : m_extra_word_chars)
    {
        if (is_blank(c))
            reject(c);
    }
}

UnitTest test_char_classifier{[]()
{
    CharClassifier classifier;
    ts_assert(classifier.classify('a') == CharCategory::Word);
    ts_assert(classifier.classify('_') == CharCategory::Word);
    ts_assert(classifier.classify('7') == CharCategory::Word);
    ts_assert(classifier.classify(' ') == CharCategory::Blank);
    ts_assert(classifier.classify('\n') == CharCategory::Blank);
    ts_assert(classifier.classify(0) == CharCategory::Blank);
    ts_assert(classifier.classify(U'\u3000') == CharCategory::Blank);
    ts_assert(classifier.classify('-') == CharCategory::Punctuation);
    ts_assert(classifier.classify('.') == CharCategory::Punctuation);

    ts_assert(classifier.matches('-', CharSet::NonBlank));
    ts_assert(classifier.matches('a', CharSet::NonBlank));
    ts_assert(not classifier.matches(' ', CharSet::NonBlank));
    ts_assert(classifier.matches(' ', CharSet::Blank | CharSet::Punctuation));
    ts_assert(classifier.classify('-', CharSet::NonBlank) == CharCategory::Word);
    ts_assert(classifier.classify(' ', CharSet::NonBlank) == CharCategory::Blank);

    const Codepoint lisp_chars[] = { '-', '?' };
    CharClassifier lisp{lisp_chars};
    ts_assert(lisp.is_word('-') and lisp.is_word('?'));
    ts_assert(lisp.is_punctuation('_'));

    CharClassifier digits_only{[](Codepoint c) { return is_basic_digit(c); }};
    ts_assert(digits_only.is_word('4'));
    ts_assert(digits_only.is_punctuation('a'));

    const Codepoint with_space[] = { '-', ' ' };
    ts_expect_throw(contract_violation, CharClassifier{with_space});
    ts_expect_throw(contract_violation, CharClassifier{[](Codepoint c) { return c != '.'; }});
    ts_expect_throw(contract_violation, CharClassifier{[](Codepoint c) { return c == '\n'; }});
    ts_expect_throw(contract_violation, CharClassifier{[](Codepoint c) { return c == 0; }});
    ts_expect_throw(contract_violation, CharClassifier{WordPredicate{nullptr}});
}};

}
