#ifndef exception_hh_INCLUDED
#define exception_hh_INCLUDED

#include "string.hh"

namespace TextSeek
{

struct exception
{
    virtual ~exception() = default;
    virtual StringView what() const;
};

struct runtime_error : exception
{
    runtime_error(String what)
        : m_what(std::move(what)) {}

    StringView what() const override { return m_what; }
    void set_what(String what) { m_what = std::move(what); }

private:
    String m_what;
};

struct logic_error : exception
{
};

// Raised when a caller supplies something the library cannot work with,
// such as a word predicate accepting line breaks.
struct contract_violation : logic_error
{
    contract_violation(String what)
        : m_what(std::move(what)) {}

    StringView what() const override { return m_what; }

private:
    String m_what;
};

}

#endif // exception_hh_INCLUDED
