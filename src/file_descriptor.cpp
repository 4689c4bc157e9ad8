#include "hyprsession/file_descriptor.hpp"

#include <fcntl.h>

namespace hyprsession {

    bool set_cloexec(int fd) {
        const int flags = ::fcntl(fd, F_GETFD);
        if (flags < 0) {
            return false;
        }
        return ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
    }

    bool set_nonblocking(int fd) {
        const int flags = ::fcntl(fd, F_GETFL);
        if (flags < 0) {
            return false;
        }
        return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
    }

}
