#ifndef enum_hh_INCLUDED
#define enum_hh_INCLUDED

#include "string.hh"
#include "meta.hh"

namespace TextSeek
{

template<typename T> struct EnumDesc { T value; StringView name; };

template<typename T>
concept DescribedEnum = requires { enum_desc(Meta::Type<T>{}); };

template<DescribedEnum T>
StringView enum_name(T value)
{
    for (auto& desc : enum_desc(Meta::Type<T>{}))
        if (desc.value == value)
            return desc.name;
    return {};
}

}

#endif // enum_hh_INCLUDED
