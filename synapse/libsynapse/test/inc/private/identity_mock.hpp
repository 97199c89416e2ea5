#ifndef SYNAPSE_TEST_IDENTITY_MOCK_HPP_
#define SYNAPSE_TEST_IDENTITY_MOCK_HPP_

#include <gmock/gmock.h>

#include <cstdint>
#include <string>
#include <vector>

#include "identity.hpp"

using namespace ::synapse::trust;

class IdentityMock : public Identity
{
public:
    MOCK_METHOD(std::string, agent_id, (), (const, override));
    MOCK_METHOD(std::string, public_key, (), (const, override));
    MOCK_METHOD(std::vector<uint8_t>, sign, (const std::string &), (const, override));
};

#endif  // SYNAPSE_TEST_IDENTITY_MOCK_HPP_
