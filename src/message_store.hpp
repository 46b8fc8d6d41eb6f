#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <mw/database.hpp>
#include <mw/error.hpp>

#include "types.hpp"

class MessageStoreInterface
{
public:
    virtual ~MessageStoreInterface() = default;
    virtual mw::E<void> init() = 0;

    // Atomic insert-if-absent keyed by message_id. Exactly one of any
    // number of racing callers gets CREATED. The ingested_at of the
    // candidate is ignored; the store assigns it.
    virtual mw::E<InsertOutcome> insertMessage(const Message& msg) = 0;

    // Ordered by timestamp, then message_id. The limit must be in
    // [1, 100] and the offset non-negative.
    virtual mw::E<MessagePage> listMessages(const MessageFilter& filter,
                                            int limit, int offset,
                                            std::chrono::milliseconds timeout) = 0;
    virtual mw::E<Stats> stats(std::chrono::milliseconds timeout) = 0;

    // Whether the storage is reachable and has the schema.
    virtual bool ready() = 0;
};

// SQLite backed store. Each call opens its own connection, so
// concurrent callers never share a transaction.
class MessageStore : public MessageStoreInterface
{
public:
    explicit MessageStore(const std::string& path);
    mw::E<void> init() override;

    mw::E<InsertOutcome> insertMessage(const Message& msg) override;
    mw::E<MessagePage> listMessages(const MessageFilter& filter, int limit,
                                    int offset,
                                    std::chrono::milliseconds timeout) override;
    mw::E<Stats> stats(std::chrono::milliseconds timeout) override;
    bool ready() override;

    static constexpr int MAX_LIMIT = 100;
    static constexpr size_t TOP_SENDERS = 10;

private:
    std::string db_path;

    mw::E<std::unique_ptr<mw::SQLite>>
    connect(std::chrono::milliseconds busy_timeout) const;
};
