#ifndef XFER_TEST_TRANSITCONNECTOR_MOCK_HPP_
#define XFER_TEST_TRANSITCONNECTOR_MOCK_HPP_

#include <gmock/gmock.h>

#include "transitconnector.hpp"

using namespace ::xfer::transit;

class TransitConnectorMock : public TransitConnector
{
public:
    MOCK_METHOD(Abilities, our_abilities, (), (const, override));
    MOCK_METHOD(std::shared_ptr<const Hints>, our_hints, (), (const, override));
    MOCK_METHOD(std::future<std::unique_ptr<TransitChannel>>, leader_connect,
        (const TransitKey &, Abilities, std::shared_ptr<const Hints>), (override));
    MOCK_METHOD(std::future<std::unique_ptr<TransitChannel>>, follower_connect,
        (const TransitKey &, Abilities, std::shared_ptr<const Hints>), (override));
};

#endif  // XFER_TEST_TRANSITCONNECTOR_MOCK_HPP_
