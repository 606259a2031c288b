#ifndef option_types_hh_INCLUDED
#define option_types_hh_INCLUDED

#include "array_view.hh"
#include "enum.hh"
#include "exception.hh"
#include "flags.hh"
#include "format.hh"
#include "option.hh"
#include "string.hh"
#include "string_utils.hh"
#include "units.hh"

#include <algorithm>

namespace TextSeek
{

template<typename Enum> requires std::is_enum_v<Enum>
String option_type_name(Meta::Type<Enum>)
{
    Vector<StringView> names;
    for (auto& desc : enum_desc(Meta::Type<Enum>{}))
        names.push_back(desc.name);
    return format("{}({})", with_bit_ops(Meta::Type<Enum>{}) ? "flags" : "enum",
                  join(names, '|'));
}

inline String option_to_string(int opt) { return to_string(opt); }
inline int option_from_string(Meta::Type<int>, StringView str) { return str_to_int(str); }
constexpr StringView option_type_name(Meta::Type<int>) { return "int"; }

inline String option_to_string(bool opt) { return opt ? "true" : "false"; }
inline bool option_from_string(Meta::Type<bool>, StringView str)
{
    if (str == "true" or str == "yes")
        return true;
    else if (str == "false" or str == "no")
        return false;
    else
        throw runtime_error("boolean values are either true, yes, false or no");
}
constexpr StringView option_type_name(Meta::Type<bool>) { return "bool"; }

inline String option_to_string(Codepoint opt) { return to_string(opt); }
inline Codepoint option_from_string(Meta::Type<Codepoint>, StringView str)
{
    if (str.char_length() != 1)
        throw runtime_error{format("'{}' is not a single codepoint", str)};
    return utf8::codepoint(str.begin(), str.end());
}
constexpr StringView option_type_name(Meta::Type<Codepoint>) { return "codepoint"; }

template<typename T>
String option_to_string(const Vector<T>& opt)
{
    String res;
    for (auto& value : opt)
    {
        if (not res.empty())
            res += " ";
        res += option_to_string(value);
    }
    return res;
}

template<typename T>
Vector<T> option_from_strings(Meta::Type<Vector<T>>, ConstArrayView<String> strs)
{
    Vector<T> res;
    for (auto& str : strs)
        res.push_back(option_from_string(Meta::Type<T>{}, str));
    return res;
}

template<typename T>
String option_type_name(Meta::Type<Vector<T>>)
{
    return option_type_name(Meta::Type<T>{}) + "-list"_sv;
}

template<DescribedEnum Flags> requires WithBitOps<Flags>
String option_to_string(Flags flags)
{
    String res;
    for (auto& desc : enum_desc(Meta::Type<Flags>{}))
    {
        if (not (flags & desc.value))
            continue;
        if (not res.empty())
            res += "|";
        res += desc.name;
    }
    return res;
}

template<DescribedEnum Enum> requires (not WithBitOps<Enum>)
String option_to_string(Enum e)
{
    auto name = enum_name(e);
    ts_assert(not name.empty());
    return name.str();
}

template<DescribedEnum Flags> requires WithBitOps<Flags>
Flags option_from_string(Meta::Type<Flags>, StringView str)
{
    constexpr auto desc = enum_desc(Meta::Type<Flags>{});
    Flags flags{};
    for (auto s : split(str, '|'))
    {
        auto it = std::find_if(desc.begin(), desc.end(),
                               [s](const EnumDesc<Flags>& d) { return d.name == s; });
        if (it == desc.end())
            throw runtime_error(format("invalid flag value '{}'", s));
        flags |= it->value;
    }
    return flags;
}

template<DescribedEnum Enum> requires (not WithBitOps<Enum>)
Enum option_from_string(Meta::Type<Enum>, StringView str)
{
    constexpr auto desc = enum_desc(Meta::Type<Enum>{});
    auto it = std::find_if(desc.begin(), desc.end(),
                           [str](const EnumDesc<Enum>& d) { return d.name == str; });
    if (it == desc.end())
        throw runtime_error(format("invalid enum value '{}'", str));
    return it->value;
}

}

#endif // option_types_hh_INCLUDED
