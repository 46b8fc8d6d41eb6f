#pragma once

#include <expected>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

// Checks an inbound event payload field by field. Every violation is
// reported, not just the first one. Unknown fields are ignored.
class MessageValidator
{
public:
    using Result = std::expected<Message, std::vector<ValidationError>>;

    Result validate(const nlohmann::json& payload) const;
    // Decode `raw_body` as JSON, then validate().
    Result validateBody(std::string_view raw_body) const;
};
