#ifndef option_hh_INCLUDED
#define option_hh_INCLUDED

#include "array_view.hh"
#include "exception.hh"
#include "meta.hh"
#include "string.hh"
#include "unicode.hh"
#include "vector.hh"

namespace TextSeek
{

// Forward declare functions that wont get found by ADL
inline String option_to_string(int opt);
inline String option_to_string(bool opt);
inline String option_to_string(Codepoint opt);

template<typename T> String option_to_string(const Vector<T>& opt);

// Default fallback to single value functions
template<typename T>
decltype(option_from_string(Meta::Type<T>{}, StringView{}))
option_from_strings(Meta::Type<T>, ConstArrayView<String> strs)
{
    if (strs.size() != 1)
        throw runtime_error("expected a single value for option");
    return option_from_string(Meta::Type<T>{}, strs[0]);
}

}

#endif // option_hh_INCLUDED
