#include <layout_placement/id_generator.hpp>
#include <cstdio>
#include <random>

namespace layout_placement {

IdGenerator sequential_ids(const std::string& prefix) {
    return [prefix, next = std::uint64_t{0}]() mutable {
        return prefix + "-" + std::to_string(++next);
    };
}

IdGenerator random_ids(std::uint64_t seed) {
    return [engine = std::mt19937_64(seed)]() mutable {
        const std::uint64_t hi = engine();
        const std::uint64_t lo = engine();
        // Set version (4) and RFC 4122 variant bits.
        const std::uint64_t hi_v4 = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        const std::uint64_t lo_var = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
        char buf[37];
        (void)std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
            static_cast<unsigned>(hi_v4 >> 32),
            static_cast<unsigned>((hi_v4 >> 16) & 0xFFFF),
            static_cast<unsigned>(hi_v4 & 0xFFFF),
            static_cast<unsigned>(lo_var >> 48),
            static_cast<unsigned long long>(lo_var & 0xFFFFFFFFFFFFULL));
        return std::string(buf);
    };
}

} // namespace layout_placement
