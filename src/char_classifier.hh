#ifndef char_classifier_hh_INCLUDED
#define char_classifier_hh_INCLUDED

#include "array_view.hh"
#include "enum.hh"
#include "flags.hh"
#include "unicode.hh"
#include "vector.hh"

namespace TextSeek
{

enum class CharSet
{
    Blank       = 1 << 0,
    Punctuation = 1 << 1,
    Word        = 1 << 2,
    NonBlank    = Word | Punctuation,
};

constexpr bool with_bit_ops(Meta::Type<CharSet>) { return true; }

constexpr auto enum_desc(Meta::Type<CharSet>)
{
    return make_array<EnumDesc<CharSet>>({
        { CharSet::Blank, "blank" },
        { CharSet::Punctuation, "punctuation" },
        { CharSet::Word, "word" },
    });
}

enum class CharCategory
{
    Word,
    Blank,
    Punctuation,
};

using WordPredicate = bool (*)(Codepoint);

// Splits codepoints into words, blanks and punctuation. The codepoint 0
// stands for the past the end of line position and is always a blank.
class CharClassifier
{
public:
    explicit CharClassifier(ConstArrayView<Codepoint> extra_word_chars = {'_'});
    explicit CharClassifier(WordPredicate is_word);

    bool is_word(Codepoint c) const
    {
        if (m_is_word)
            return m_is_word(c);

        if (is_alnum(c))
            return true;
        for (auto cp : m_extra_word_chars)
            if (c == cp)
                return true;
        return false;
    }

    bool is_blank(Codepoint c) const { return c == 0 or TextSeek::is_blank(c); }

    bool is_punctuation(Codepoint c) const { return not is_word(c) and not is_blank(c); }

    CharCategory classify(Codepoint c) const
    {
        if (is_word(c))
            return CharCategory::Word;
        return is_blank(c) ? CharCategory::Blank : CharCategory::Punctuation;
    }

    // classify, with the word class widened to every category in word_set
    CharCategory classify(Codepoint c, CharSet word_set) const
    {
        return matches(c, word_set) ? CharCategory::Word : classify(c);
    }

    bool matches(Codepoint c, CharSet set) const
    {
        switch (classify(c))
        {
            case CharCategory::Word: return set & CharSet::Word;
            case CharCategory::Blank: return set & CharSet::Blank;
            case CharCategory::Punctuation: return set & CharSet::Punctuation;
        }
        return false;
    }

private:
    void check_word_class() const;

    Vector<Codepoint> m_extra_word_chars;
    WordPredicate m_is_word = nullptr;
};

}

#endif // char_classifier_hh_INCLUDED
