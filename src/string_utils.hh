#ifndef string_utils_hh_INCLUDED
#define string_utils_hh_INCLUDED

#include "array_view.hh"
#include "optional.hh"
#include "string.hh"
#include "vector.hh"

namespace TextSeek
{

Vector<StringView> split(StringView str, char separator);

String join(ConstArrayView<StringView> strings, char separator);

Optional<int> str_to_int_ifp(StringView str);
int str_to_int(StringView str); // throws on error

}

#endif // string_utils_hh_INCLUDED
