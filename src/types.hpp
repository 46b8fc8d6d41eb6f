#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <mw/utils.hpp>

// Upper bound of the text field, in Unicode code points.
constexpr size_t MAX_TEXT_LENGTH = 4096;

struct Message
{
    std::string message_id;
    std::string from_address;
    std::string to_address;
    mw::Time timestamp;
    std::optional<std::string> text;
    // Assigned by the store on first insert. Unset on a candidate that
    // has not been persisted yet.
    std::optional<mw::Time> ingested_at;
};

// One field level problem in an inbound payload. The location is a
// path like {"body", "from"}.
struct ValidationError
{
    std::vector<std::string> location;
    std::string message;

    std::string locationStr() const;
};

enum class InsertOutcome { CREATED, ALREADY_EXISTS };

// All predicates are optional and are combined with AND.
struct MessageFilter
{
    std::optional<std::string> from_address;
    std::optional<mw::Time> since;
    // Case-insensitive substring of the text.
    std::optional<std::string> text_query;
};

struct MessagePage
{
    std::vector<Message> items;
    int64_t total = 0;
};

struct SenderCount
{
    std::string sender;
    int64_t count = 0;

    bool operator==(const SenderCount&) const = default;
};

struct Stats
{
    int64_t total = 0;
    int64_t distinct_senders = 0;
    // At most 10, by count descending then sender ascending.
    std::vector<SenderCount> top_senders;
    std::optional<mw::Time> earliest;
    std::optional<mw::Time> latest;
};
