// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/entropy.h>

#if defined(_WIN32)
    #define WIN32_LEAN_AND_MEAN
    #include <Windows.h>
    #include <bcrypt.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
    #include <stdlib.h>
    #define MULID_USE_ARC4RANDOM 1
#elif defined(__linux__)
    #include <sys/random.h>
    #include <errno.h>
#else
    #include <fcntl.h>
    #include <unistd.h>
    #include <errno.h>
#endif

using namespace mulid;

namespace {

    class system_entropy_source final : public entropy_source {
    public:
        auto read(std::span<uint8_t> dest, std::error_code & ec) -> size_t override {
            ec.clear();
            if (dest.empty())
                return 0;

        #if defined(_WIN32)

            auto status = BCryptGenRandom(nullptr, dest.data(), ULONG(dest.size()), BCRYPT_USE_SYSTEM_PREFERRED_RNG);
            if (!BCRYPT_SUCCESS(status)) {
                ec = std::error_code(int(status), std::system_category());
                return 0;
            }
            return size_t(ULONG(dest.size()));

        #elif MULID_USE_ARC4RANDOM

            arc4random_buf(dest.data(), dest.size());
            return dest.size();

        #elif defined(__linux__)

            for ( ; ; ) {
                auto res = getrandom(dest.data(), dest.size(), 0);
                if (res >= 0)
                    return size_t(res);
                if (errno != EINTR) {
                    ec = std::error_code(errno, std::system_category());
                    return 0;
                }
            }

        #else

            int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
            if (fd < 0) {
                ec = std::error_code(errno, std::system_category());
                return 0;
            }
            ssize_t res;
            do {
                res = ::read(fd, dest.data(), dest.size());
            } while (res < 0 && errno == EINTR);
            if (res < 0) {
                ec = std::error_code(errno, std::system_category());
                res = 0;
            }
            close(fd);
            return size_t(res);

        #endif
        }
    };
}

auto mulid::read_full(entropy_source & source, std::span<uint8_t> dest) -> std::error_code {
    std::error_code ec;
    while (!dest.empty()) {
        size_t count = source.read(dest, ec);
        if (ec)
            return ec;
        if (count == 0)
            return std::make_error_code(std::errc::io_error);
        dest = dest.subspan(std::min(count, dest.size()));
    }
    return ec;
}

auto mulid::system_entropy() noexcept -> entropy_source & {
    static system_entropy_source instance;
    return instance;
}
