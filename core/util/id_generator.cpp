#include "id_generator.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace itemvault {
namespace util {

namespace {
constexpr char kHexDigits[] = "0123456789abcdef";
}  // namespace

RandomIdGenerator::RandomIdGenerator() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    rng_.seed(seq);
}

std::string RandomIdGenerator::next_id() {
    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hi = rng_();
        lo = rng_();
    }

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::array<uint8_t, 16> bytes;
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
        bytes[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
    }

    std::string id;
    id.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id.push_back('-');
        }
        id.push_back(kHexDigits[bytes[i] >> 4]);
        id.push_back(kHexDigits[bytes[i] & 0x0F]);
    }
    return id;
}

std::string make_error_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t value = rng();

    std::string id = "err-";
    for (int shift = 60; shift >= 0; shift -= 4) {
        id.push_back(kHexDigits[(value >> shift) & 0x0F]);
    }
    return id;
}

bool looks_like_uuid(const std::string &id) {
    if (id.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace util
}  // namespace itemvault
