#include "random.hpp"

namespace synapse::utils
{
std::string Random::hex_string(size_t count)
{
    constexpr char digits[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(count);
    while (count--)
    {
        out.push_back(digits[next<int>(0, 15)]);
    }
    return out;
}

std::mt19937_64 &Random::prng()
{
    static std::mt19937_64 engine {std::random_device {}()};
    return engine;
}

std::mutex &Random::mutex()
{
    static std::mutex m;
    return m;
}
}  // namespace synapse::utils
