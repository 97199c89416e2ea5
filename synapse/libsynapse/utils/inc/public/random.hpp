#ifndef SYNAPSE_UTILS_RANDOM_HPP_
#define SYNAPSE_UTILS_RANDOM_HPP_

#include <cstdint>
#include <limits>
#include <mutex>
#include <random>
#include <string>
#include <type_traits>

namespace synapse::utils
{
// Process wide PRNG seeded from the system entropy source
class Random
{
public:
    template<typename Int = int>
    static auto next(Int min = 0, Int max = std::numeric_limits<Int>::max())
        -> std::enable_if_t<std::is_integral_v<Int>, Int>
    {
        std::uniform_int_distribution<Int> d {min, max};
        std::lock_guard                    lock {mutex()};
        return d(prng());
    }

    // count upper case hex digits
    static std::string hex_string(size_t count);

private:
    static std::mt19937_64 &prng();
    static std::mutex      &mutex();
};
}  // namespace synapse::utils

#endif  // SYNAPSE_UTILS_RANDOM_HPP_
