#ifndef selection_hh_INCLUDED
#define selection_hh_INCLUDED

#include "coord.hh"
#include "enum.hh"
#include "meta.hh"

namespace TextSeek
{

// Caret: positions sit between characters, a selection may be empty.
// Character: positions sit on characters, a selection covers at least one.
enum class SelectionBehavior
{
    Caret,
    Character,
};

constexpr auto enum_desc(Meta::Type<SelectionBehavior>)
{
    return make_array<EnumDesc<SelectionBehavior>>({
        { SelectionBehavior::Caret, "caret" },
        { SelectionBehavior::Character, "character" },
    });
}

struct Selection
{
    Selection() = default;
    Selection(Position pos) : Selection(pos,pos) {}
    Selection(Position anchor, Position active)
        : m_anchor{anchor}, m_active{active} {}

    const Position& anchor() const { return m_anchor; }
    const Position& active() const { return m_active; }

    bool is_forward() const { return m_anchor <= m_active; }

    const Position& min() const { return m_anchor <= m_active ? m_anchor : m_active; }
    const Position& max() const { return m_anchor <= m_active ? m_active : m_anchor; }

    friend bool operator==(const Selection&, const Selection&) = default;

private:
    Position m_anchor;
    Position m_active;
};

}

#endif // selection_hh_INCLUDED
