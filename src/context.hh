#ifndef context_hh_INCLUDED
#define context_hh_INCLUDED

#include "char_classifier.hh"
#include "optional.hh"
#include "option_manager.hh"
#include "selection.hh"

namespace TextSeek
{

class Document;

// A Context gives seeks access to the document they run on and to the
// character classification and selection behavior configured for it.
//
// The classifier and behavior are read from the options at construction
// only; build a new Context to see later option changes. A Context must
// not outlive its document nor its option manager.
class Context
{
public:
    Context(const Document& document, const OptionManager& options);
    Context(const Document& document, const OptionManager& options,
            CharClassifier classifier);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const Document& document() const { return m_document; }
    const OptionManager& options() const { return m_options; }
    const CharClassifier& classifier() const { return m_classifier; }
    SelectionBehavior selection_behavior() const { return m_selection_behavior; }

private:
    const Document& m_document;
    const OptionManager& m_options;
    CharClassifier m_classifier;
    SelectionBehavior m_selection_behavior;
};

}

#endif // context_hh_INCLUDED
