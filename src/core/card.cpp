/**
 * @file card.cpp
 * @brief Rating parsing and identifier generation
 */

#include <recall/core/card.hpp>

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace recall {

auto rating_from_string(std::string_view name) -> std::optional<rating> {
    for (auto r : all_ratings) {
        const auto expected = to_string(r);
        if (expected.size() != name.size()) {
            continue;
        }
        bool equal = true;
        for (std::size_t i = 0; i < name.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(name[i])) != expected[i]) {
                equal = false;
                break;
            }
        }
        if (equal) {
            return r;
        }
    }
    return std::nullopt;
}

auto generate_id() -> std::string {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t hi = dis(gen);
    std::uint64_t lo = dis(gen);

    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (hi >> 32) << '-';
    oss << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-';
    oss << std::setw(4) << (hi & 0xFFFF) << '-';
    oss << std::setw(4) << (lo >> 48) << '-';
    oss << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);

    return oss.str();
}

}  // namespace recall
