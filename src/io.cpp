#include "io.hpp"
#include <cerrno>
#include <unistd.h>

namespace hk
{
    bool write_all(int fd, std::string_view s)
    {
        std::size_t length = s.length();
        std::size_t sent = 0;

        while (sent < length)
        {
            ssize_t n = ::write(fd, s.data() + sent, length - sent);
            if (n > 0)
            {
                sent += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR)
            {
                continue;
            }
            // EPIPE, ECONNRESET, EAGAIN (send timeout) or a zero-length write
            return false;
        }
        return true;
    }
}
