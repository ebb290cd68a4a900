#include "input.h"

#include <errno.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace
{
termios g_original;
bool g_has_original = false;

// Escape sequences arrive in one burst; a lone ESC does not.
constexpr int escape_sequence_wait_ms = 30;

// Upper bound on parameter bytes in a CSI sequence we skip over.
constexpr int max_sequence_length = 16;

bool wait_readable(int timeout_ms)
{
    pollfd fd{STDIN_FILENO, POLLIN, 0};
    int result = 0;
    do
    {
        result = poll(&fd, 1, timeout_ms);
    } while (result < 0 && errno == EINTR);
    return result > 0 && (fd.revents & POLLIN);
}

bool read_byte(unsigned char& out)
{
    ssize_t result = read(STDIN_FILENO, &out, 1);
    return result == 1;
}
}

void input_init()
{
    termios current;
    if (tcgetattr(STDIN_FILENO, &current) == 0)
    {
        g_original = current;
        g_has_original = true;
        current.c_lflag &= static_cast<unsigned int>(~(ICANON | ECHO));
        current.c_cc[VMIN] = 0;
        current.c_cc[VTIME] = 0;
        tcsetattr(STDIN_FILENO, TCSANOW, &current);
    }
}

void input_shutdown()
{
    if (g_has_original)
    {
        tcsetattr(STDIN_FILENO, TCSANOW, &g_original);
        g_has_original = false;
    }
}

int input_poll_key(int timeout_ms)
{
    if (!wait_readable(timeout_ms))
    {
        return input_key_none;
    }

    unsigned char ch = 0;
    if (!read_byte(ch))
    {
        return input_key_none;
    }

    if (ch == '\r')
    {
        return input_key_enter;
    }
    if (ch == 0x08)
    {
        return input_key_backspace;
    }

    if (ch == 0x1b)
    {
        unsigned char seq[2] = {0, 0};
        if (!wait_readable(escape_sequence_wait_ms) || !read_byte(seq[0]))
        {
            return input_key_escape;
        }
        if (seq[0] != '[' && seq[0] != 'O')
        {
            return input_key_escape;
        }
        if (!wait_readable(escape_sequence_wait_ms) || !read_byte(seq[1]))
        {
            return input_key_escape;
        }
        switch (seq[1])
        {
        case 'A':
            return input_key_up;
        case 'B':
            return input_key_down;
        case 'D':
            return input_key_left;
        case 'C':
            return input_key_right;
        default:
            break;
        }

        // Skip the rest of an unknown CSI sequence (Delete is ESC [ 3 ~).
        unsigned char next = seq[1];
        int length = 1;
        while (seq[0] == '[' && (next < 0x40 || next > 0x7e) && length < max_sequence_length)
        {
            if (!wait_readable(escape_sequence_wait_ms) || !read_byte(next))
            {
                break;
            }
            ++length;
        }
        return input_key_none;
    }

    return ch;
}
