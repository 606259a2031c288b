#ifndef document_hh_INCLUDED
#define document_hh_INCLUDED

#include "array_view.hh"
#include "string.hh"
#include "units.hh"
#include "vector.hh"

namespace TextSeek
{

// Read-only view of a text, line by line. Lines are given without their
// terminator and a document always has at least one line.
//
// A document must not change while a seek is running on it.
class Document
{
public:
    virtual ~Document() = default;

    virtual LineCount line_count() const = 0;
    virtual ConstArrayView<Codepoint> line(LineCount line) const = 0;

    CharCount line_length(LineCount line) const { return (int)this->line(line).size(); }
};

// Document over utf-8 text, lines are split on '\n' and a '\r' preceding
// it is dropped.
class StringDocument : public Document
{
public:
    explicit StringDocument(StringView content);

    LineCount line_count() const override { return (int)m_lines.size(); }
    ConstArrayView<Codepoint> line(LineCount line) const override
    {
        ts_assert(line >= 0 and line < line_count());
        return m_lines[(size_t)line];
    }

private:
    Vector<Vector<Codepoint>> m_lines;
};

}

#endif // document_hh_INCLUDED
