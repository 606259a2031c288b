#include "assert.hh"

#include "format.hh"
#include "exception.hh"
#include "debug.hh"

#include <sys/types.h>
#include <unistd.h>

namespace TextSeek
{

struct assert_failed : logic_error
{
    assert_failed(String message)
        : m_message(std::move(message)) {}

    StringView what() const override { return m_message; }
private:
    String m_message;
};

void on_assert_failed(const char* message)
{
    write_to_debug_log(format("assert failed: '{}' (pid: {})", message, getpid()));
    throw assert_failed(message);
}

}
