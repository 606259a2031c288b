#include "document.hh"

#include "unit_tests.hh"
#include "utf8.hh"

namespace TextSeek
{

StringDocument::StringDocument(StringView content)
{
    m_lines.emplace_back();
    for (auto it = content.begin(), end = content.end(); it != end;)
    {
        const Codepoint cp = utf8::read_codepoint(it, end);
        if (cp == '\n')
        {
            auto& line = m_lines.back();
            if (not line.empty() and line.back() == '\r')
                line.pop_back();
            m_lines.emplace_back();
        }
        else
            m_lines.back().push_back(cp);
    }
}

UnitTest test_string_document{[]()
{
    {
        StringDocument doc{""};
        ts_assert(doc.line_count() == 1);
        ts_assert(doc.line_length(0) == 0);
    }
    {
        StringDocument doc{"foo.\r\n  bar\n"};
        ts_assert(doc.line_count() == 3);
        ts_assert(doc.line_length(0) == 4);
        ts_assert(doc.line(0).back() == '.');
        ts_assert(doc.line_length(1) == 5);
        ts_assert(doc.line_length(2) == 0);
    }
    {
        StringDocument doc{"ma\xC3\xAFs\n\xE3\x80\x82\r"};
        ts_assert(doc.line_count() == 2);
        ts_assert(doc.line_length(0) == 4);
        ts_assert(doc.line(0)[2] == 0xEF);
        ts_assert(doc.line_length(1) == 2);
        ts_assert(doc.line(1)[0] == 0x3002);
    }
}};

}
