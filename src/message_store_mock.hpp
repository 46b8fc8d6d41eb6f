#pragma once
#include <gmock/gmock.h>
#include "message_store.hpp"

class MessageStoreMock : public MessageStoreInterface {
public:
    MOCK_METHOD(mw::E<void>, init, (), (override));
    MOCK_METHOD(mw::E<InsertOutcome>, insertMessage, (const Message&), (override));
    MOCK_METHOD(mw::E<MessagePage>, listMessages,
                (const MessageFilter&, int, int, std::chrono::milliseconds), (override));
    MOCK_METHOD(mw::E<Stats>, stats, (std::chrono::milliseconds), (override));
    MOCK_METHOD(bool, ready, (), (override));
};
