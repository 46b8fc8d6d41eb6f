#include "message_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <mw/error.hpp>
#include <mw/utils.hpp>
#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include "utils.hpp"

namespace {

// How long a writer waits on the database lock.
constexpr std::chrono::milliseconds WRITE_BUSY_TIMEOUT(5000);
constexpr std::chrono::milliseconds READY_BUSY_TIMEOUT(1000);

using Deadline = std::chrono::steady_clock::time_point;

// Virtual machine steps between two looks at the clock.
constexpr int PROGRESS_STEPS = 1000;

bool pastDeadline(const Deadline& deadline)
{
    return std::chrono::steady_clock::now() > deadline;
}

mw::E<void> checkDeadline(const Deadline& deadline)
{
    if(pastDeadline(deadline))
    {
        return std::unexpected(mw::runtimeError("Query timed out"));
    }
    return {};
}

int abortPastDeadline(void* arg)
{
    return pastDeadline(*static_cast<const Deadline*>(arg)) ? 1 : 0;
}

// Make any statement on `db` fail with SQLITE_INTERRUPT once `deadline`
// has passed. The deadline must outlive the connection.
void installDeadline(mw::SQLite& db, const Deadline& deadline)
{
    sqlite3_progress_handler(db.data(), PROGRESS_STEPS, abortPastDeadline,
                             const_cast<Deadline*>(&deadline));
}

// An interrupted statement reports a timeout rather than the raw SQLite
// error.
template<typename T>
mw::E<T> orTimeout(mw::E<T>&& result, const Deadline& deadline)
{
    if(!result.has_value() && pastDeadline(deadline))
    {
        return std::unexpected(mw::runtimeError("Query timed out"));
    }
    return std::move(result);
}

// Every filter predicate is always present in the SQL and is switched
// off by an empty parameter, so that the statement has a fixed set of
// bindings: ?1 sender, ?2 since (microseconds), ?3 raw text query, ?4
// LIKE pattern of the text query.
constexpr char FILTER_CLAUSE[] =
    "WHERE (?1 = '' OR from_msisdn = ?1) AND ts >= ?2 "
    "AND (?3 = '' OR text LIKE ?4 ESCAPE '\\')";

struct FilterParams
{
    std::string from;
    int64_t since;
    std::string query;
    std::string pattern;
};

FilterParams filterParams(const MessageFilter& filter)
{
    FilterParams params;
    params.from = filter.from_address.value_or("");
    params.since = filter.since.has_value() ? timeToMicros(*filter.since)
        : std::numeric_limits<int64_t>::min();
    params.query = filter.text_query.value_or("");
    params.pattern = "%" + escapeLikePattern(params.query) + "%";
    return params;
}

using MessageTuple = std::tuple<std::string, std::string, std::string, int64_t,
                                std::optional<std::string>, int64_t>;

Message rowToMessage(const MessageTuple& row)
{
    Message m;
    m.message_id = std::get<0>(row);
    m.from_address = std::get<1>(row);
    m.to_address = std::get<2>(row);
    m.timestamp = microsToTime(std::get<3>(row));
    m.text = std::get<4>(row);
    m.ingested_at = microsToTime(std::get<5>(row));
    return m;
}

} // namespace

MessageStore::MessageStore(const std::string& path) : db_path(path) {}

mw::E<std::unique_ptr<mw::SQLite>>
MessageStore::connect(std::chrono::milliseconds busy_timeout) const
{
    auto conn = mw::SQLite::connectFile(db_path);
    if(!conn)
    {
        return std::unexpected(conn.error());
    }
    std::unique_ptr<mw::SQLite> db = std::move(*conn);
    DO_OR_RETURN(db->execute(std::format("PRAGMA busy_timeout = {};",
                                         busy_timeout.count())));
    return db;
}

mw::E<void> MessageStore::init()
{
    std::filesystem::path parent = std::filesystem::path(db_path).parent_path();
    if(!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if(ec)
        {
            return std::unexpected(mw::runtimeError(std::format(
                "Failed to create database directory {}: {}", parent.string(),
                ec.message())));
        }
    }

    ASSIGN_OR_RETURN(auto db, connect(WRITE_BUSY_TIMEOUT));
    DO_OR_RETURN(db->execute("PRAGMA journal_mode=WAL;"));

    const std::vector<std::string> statements = {
        R"(CREATE TABLE IF NOT EXISTS messages (
            message_id TEXT PRIMARY KEY,
            from_msisdn TEXT NOT NULL,
            to_msisdn TEXT NOT NULL,
            ts INTEGER NOT NULL,
            text TEXT,
            ingested_at INTEGER NOT NULL
        );)",
        "CREATE INDEX IF NOT EXISTS idx_messages_ts "
        "ON messages (ts, message_id);",
        "CREATE INDEX IF NOT EXISTS idx_messages_from "
        "ON messages (from_msisdn);",
    };

    for(const auto& sql : statements)
    {
        auto res = db->execute(sql);
        if(!res)
        {
            spdlog::error("Failed to execute SQL: {}", sql);
            return std::unexpected(res.error());
        }
    }
    return {};
}

mw::E<InsertOutcome> MessageStore::insertMessage(const Message& msg)
{
    ASSIGN_OR_RETURN(auto db, connect(WRITE_BUSY_TIMEOUT));
    // The primary key settles races: the conflicting insert writes
    // nothing and returns no row.
    const char* sql =
        "INSERT INTO messages (message_id, from_msisdn, to_msisdn, ts, "
        "text, ingested_at) VALUES (?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(message_id) DO NOTHING RETURNING message_id;";
    ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
    DO_OR_RETURN(stmt.bind(msg.message_id, msg.from_address, msg.to_address,
                           timeToMicros(msg.timestamp), msg.text,
                           timeToMicros(mw::Clock::now())));
    ASSIGN_OR_RETURN(auto rows, db->eval<std::string>(std::move(stmt)));
    if(rows.empty())
    {
        return InsertOutcome::ALREADY_EXISTS;
    }
    return InsertOutcome::CREATED;
}

mw::E<MessagePage> MessageStore::listMessages(
    const MessageFilter& filter, int limit, int offset,
    std::chrono::milliseconds timeout)
{
    if(limit < 1 || limit > MAX_LIMIT || offset < 0)
    {
        return std::unexpected(mw::runtimeError(std::format(
            "Invalid page: limit {}, offset {}", limit, offset)));
    }
    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    const FilterParams params = filterParams(filter);

    ASSIGN_OR_RETURN(auto db, connect(timeout));
    installDeadline(*db, deadline);
    // Count and page come from the same snapshot.
    DO_OR_RETURN(db->execute("BEGIN;"));

    MessagePage page;
    {
        const std::string sql =
            std::format("SELECT COUNT(*) FROM messages {};", FILTER_CLAUSE);
        ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql.c_str()));
        DO_OR_RETURN(stmt.bind(params.from, params.since, params.query,
                               params.pattern));
        ASSIGN_OR_RETURN(auto rows, orTimeout(db->eval<int64_t>(std::move(stmt)),
                                              deadline));
        if(!rows.empty())
        {
            page.total = std::get<0>(rows[0]);
        }
    }
    DO_OR_RETURN(checkDeadline(deadline));

    if(offset < page.total)
    {
        const std::string sql = std::format(
            "SELECT message_id, from_msisdn, to_msisdn, ts, text, ingested_at "
            "FROM messages {} ORDER BY ts ASC, message_id ASC "
            "LIMIT ?5 OFFSET ?6;", FILTER_CLAUSE);
        ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql.c_str()));
        DO_OR_RETURN(stmt.bind(params.from, params.since, params.query,
                               params.pattern, limit, offset));
        ASSIGN_OR_RETURN(
            auto rows,
            orTimeout(db->eval<std::string, std::string, std::string, int64_t,
                               std::optional<std::string>, int64_t>(
                                   std::move(stmt)),
                      deadline));
        for(const auto& row : rows)
        {
            page.items.push_back(rowToMessage(row));
        }
        DO_OR_RETURN(checkDeadline(deadline));
    }

    DO_OR_RETURN(db->execute("COMMIT;"));
    return page;
}

mw::E<Stats> MessageStore::stats(std::chrono::milliseconds timeout)
{
    const Deadline deadline = std::chrono::steady_clock::now() + timeout;
    ASSIGN_OR_RETURN(auto db, connect(timeout));
    installDeadline(*db, deadline);
    // All the numbers come from one snapshot.
    DO_OR_RETURN(db->execute("BEGIN;"));

    Stats result;
    {
        ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(
            "SELECT COUNT(*), COUNT(DISTINCT from_msisdn) FROM messages;"));
        ASSIGN_OR_RETURN(auto rows,
                         orTimeout(db->eval<int64_t, int64_t>(std::move(stmt)),
                                   deadline));
        if(!rows.empty())
        {
            result.total = std::get<0>(rows[0]);
            result.distinct_senders = std::get<1>(rows[0]);
        }
    }
    DO_OR_RETURN(checkDeadline(deadline));

    if(result.total > 0)
    {
        {
            ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(
                "SELECT MIN(ts), MAX(ts) FROM messages;"));
            ASSIGN_OR_RETURN(auto rows,
                             orTimeout(db->eval<int64_t, int64_t>(
                                           std::move(stmt)), deadline));
            if(!rows.empty())
            {
                result.earliest = microsToTime(std::get<0>(rows[0]));
                result.latest = microsToTime(std::get<1>(rows[0]));
            }
        }
        DO_OR_RETURN(checkDeadline(deadline));

        const char* sql =
            "SELECT from_msisdn, COUNT(*) AS n FROM messages "
            "GROUP BY from_msisdn ORDER BY n DESC, from_msisdn ASC LIMIT ?;";
        ASSIGN_OR_RETURN(auto stmt, db->statementFromStr(sql));
        DO_OR_RETURN(stmt.bind(static_cast<int>(TOP_SENDERS)));
        ASSIGN_OR_RETURN(auto senders,
                         orTimeout(db->eval<std::string, int64_t>(
                                       std::move(stmt)), deadline));
        for(const auto& row : senders)
        {
            result.top_senders.push_back({std::get<0>(row), std::get<1>(row)});
        }
        DO_OR_RETURN(checkDeadline(deadline));
    }

    DO_OR_RETURN(db->execute("COMMIT;"));
    return result;
}

bool MessageStore::ready()
{
    auto conn = connect(READY_BUSY_TIMEOUT);
    if(!conn)
    {
        spdlog::warn("Database is not reachable: {}",
                     mw::errorMsg(conn.error()));
        return false;
    }
    auto count = (*conn)->evalToValue<int64_t>(
        "SELECT COUNT(*) FROM sqlite_master "
        "WHERE type = 'table' AND name = 'messages';");
    if(!count)
    {
        spdlog::warn("Database readiness check failed: {}", mw::errorMsg(count.error()));
        return false;
    }
    return *count > 0;
}
