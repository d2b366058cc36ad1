// We need our declaration
#include "../../include/Platform/Platform.hpp"
// We need locks too
#include "../../include/Threading/Lock.hpp"

#include <termios.h>
namespace Platform
{
    bool queryUserInput(const char * prompt, char * buffer, size_t & size, const bool hidden)
    {
        struct termios oflags, nflags;

        // Don't allow multiple thread from running here
        static Threading::Lock lock;
        Threading::ScopedLock scope(lock);

        FILE *in = fopen("/dev/tty", "r+"), *out = in;
        if (in == NULL)
        {
            in = stdin;
            out = stderr;
        }

        bool terminal = isatty(fileno(in)) && tcgetattr(fileno(in), &oflags) == 0;
        if (hidden && terminal)
        {   // Disabling echo
            nflags = oflags;
            nflags.c_lflag &= ~ECHO;
            nflags.c_lflag |= ECHONL;
            if (tcsetattr(fileno(in), TCSANOW, &nflags) != 0) terminal = false;
        }

        bool ok = fputs(prompt, out) >= 0 && fflush(out) == 0 && fgets(buffer, (int)size, in) != NULL;
        if (hidden && terminal) tcsetattr(fileno(in), TCSANOW, &oflags);
        if (in != stdin) fclose(in);
        if (!ok) return false;

        size = strlen(buffer);
        if (size && buffer[size - 1] == '\n')
            buffer[--size] = 0;

        return true;
    }

    void ignoreBrokenPipe()
    {
        struct sigaction action;
        memset(&action, 0, sizeof(action));
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        sigaction(SIGPIPE, &action, 0);
    }
}
