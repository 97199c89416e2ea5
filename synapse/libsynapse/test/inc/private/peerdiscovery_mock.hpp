#ifndef SYNAPSE_TEST_PEERDISCOVERY_MOCK_HPP_
#define SYNAPSE_TEST_PEERDISCOVERY_MOCK_HPP_

#include <gmock/gmock.h>

#include <future>
#include <string>
#include <vector>

#include "peerdiscovery.hpp"

using namespace ::synapse::transfer;

class PeerDiscoveryMock : public PeerDiscovery
{
public:
    using PeerList = std::vector<::synapse::model::Peer>;

    MOCK_METHOD(
        std::future<PeerList>, discover_peers, (const ::synapse::model::Link &), (override));
    MOCK_METHOD(std::future<bool>, announce, (const ::synapse::model::Link &, const std::string &),
        (override));
    MOCK_METHOD(std::future<PeerList>, refresh, (const PeerList &), (override));
};

#endif  // SYNAPSE_TEST_PEERDISCOVERY_MOCK_HPP_
