#pragma once

#include <mutex>
#include <random>
#include <string>

namespace itemvault {
namespace util {

// Interface for item id generation to enable mocking
class IIdGenerator {
public:
    virtual ~IIdGenerator() = default;
    virtual std::string next_id() = 0;
};

/**
 * @brief Random (version 4) UUID generator
 *
 * Produces lowercase 8-4-4-4-12 identifiers from a 64-bit Mersenne Twister
 * seeded by std::random_device. Thread-safe: one generator is shared by all
 * request threads.
 */
class RandomIdGenerator : public IIdGenerator {
public:
    RandomIdGenerator();

    std::string next_id() override;

private:
    std::mt19937_64 rng_;
    std::mutex mutex_;
};

// Short opaque identifier used to correlate a 500 response with its log line
std::string make_error_id();

// True if `id` has the canonical 36-character UUID layout
bool looks_like_uuid(const std::string &id);

}  // namespace util
}  // namespace itemvault
