#include "exception.hh"

#include <typeinfo>

namespace TextSeek
{

StringView exception::what() const
{
    return typeid(*this).name();
}

}
