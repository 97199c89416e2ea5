#ifndef SYNAPSE_TEST_TESTUTILS_HPP_
#define SYNAPSE_TEST_TESTUTILS_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <string>
#include <utility>
#include <vector>

#include "peer.hpp"

namespace testutils
{
bool wait_for(const std::function<bool()> &predicate, unsigned timeout_ms = 0);

template<typename T>
std::future<T> make_ready_future(T value)
{
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

// Fresh directory under the system temp dir, removed by the destructor
class TempDir
{
public:
    TempDir();
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;
    ~TempDir();

    [[nodiscard]] const std::filesystem::path &path() const;
    [[nodiscard]] std::string                  file(const std::string &name) const;

private:
    std::filesystem::path path_;
};

void write_file(const std::string &path, const std::string &contents);
void write_file(const std::string &path, const std::vector<uint8_t> &contents);
std::string read_file(const std::string &path);

synapse::model::Peer make_peer(const std::string &peer_id,
    std::chrono::seconds age = std::chrono::seconds {0}, uint16_t port = 6881);
}  // namespace testutils

#endif  // SYNAPSE_TEST_TESTUTILS_HPP_
