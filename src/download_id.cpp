#include "fetchd/download_id.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace fetchd {

DownloadId DownloadId::generate() {
    static std::mutex mutex;
    static std::mt19937_64 gen{std::random_device{}()};

    std::uint64_t hi = 0;
    std::uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = gen();
        lo = gen();
    }

    // RFC 4122 version 4, variant 1.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return DownloadId{fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                                  hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF,
                                  lo >> 48, lo & 0xFFFFFFFFFFFFULL)};
}

} // namespace fetchd
