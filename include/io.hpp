#pragma once
#include <string_view>

namespace hk
{
    // Writes the whole buffer, retrying on EINTR. False on any other failure.
    bool write_all(int fd, std::string_view s);
}
