#ifndef scope_hh_INCLUDED
#define scope_hh_INCLUDED

#include "option_manager.hh"

namespace TextSeek
{

// A level of configuration: the global scope, and below it scopes for
// instance per language, each overriding options of its parent.
class Scope
{
public:
    Scope(Scope& parent) : m_options(parent.options()) {}

    OptionManager&       options()       { return m_options; }
    const OptionManager& options() const { return m_options; }

private:
    friend class GlobalScope;
    Scope() = default;

    OptionManager m_options;
};

class GlobalScope : public Scope
{
public:
    GlobalScope();

    OptionsRegistry& option_registry() { return m_option_registry; }
    const OptionsRegistry& option_registry() const { return m_option_registry; }

private:
    OptionsRegistry m_option_registry;
};

void register_options(OptionsRegistry& registry);

}

#endif // scope_hh_INCLUDED
