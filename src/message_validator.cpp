#include "message_validator.hpp"

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils.hpp"

namespace {

ValidationError fieldError(const std::string& field, std::string msg)
{
    return {{"body", field}, std::move(msg)};
}

// Fetch a required string field. On failure, record the error and
// return nullopt.
std::optional<std::string> requiredString(const nlohmann::json& payload,
                                          const std::string& field,
                                          std::vector<ValidationError>& errors)
{
    auto it = payload.find(field);
    if(it == payload.end() || it->is_null())
    {
        errors.push_back(fieldError(field, "Field required"));
        return std::nullopt;
    }
    if(!it->is_string())
    {
        errors.push_back(fieldError(field, "Input should be a valid string"));
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

MessageValidator::Result
MessageValidator::validate(const nlohmann::json& payload) const
{
    if(!payload.is_object())
    {
        return std::unexpected(std::vector<ValidationError>{
                {{"body"}, "Input should be a JSON object"}});
    }

    std::vector<ValidationError> errors;
    Message msg;

    if(auto id = requiredString(payload, "message_id", errors); id)
    {
        if(id->empty())
        {
            errors.push_back(fieldError(
                "message_id", "String should have at least 1 character"));
        }
        msg.message_id = *std::move(id);
    }

    for(const char* field : {"from", "to"})
    {
        auto value = requiredString(payload, field, errors);
        if(!value)
        {
            continue;
        }
        if(!isE164(*value))
        {
            errors.push_back(fieldError(
                field, "must be E.164 format: + followed by digits"));
            continue;
        }
        if(std::string_view(field) == "from")
        {
            msg.from_address = *std::move(value);
        }
        else
        {
            msg.to_address = *std::move(value);
        }
    }

    if(auto ts = requiredString(payload, "ts", errors); ts)
    {
        auto t = parseTimestamp(*ts);
        if(t.has_value())
        {
            msg.timestamp = *t;
        }
        else
        {
            errors.push_back(fieldError(
                "ts", "timestamp must be ISO-8601 UTC with Z suffix"));
        }
    }

    // Absent and null both mean “no text”.
    if(auto it = payload.find("text"); it != payload.end() && !it->is_null())
    {
        if(!it->is_string())
        {
            errors.push_back(fieldError("text",
                                        "Input should be a valid string"));
        }
        else
        {
            const auto& text = it->get_ref<const std::string&>();
            if(codePointCount(text) > MAX_TEXT_LENGTH)
            {
                errors.push_back(fieldError(
                    "text", std::format("String should have at most {} "
                                        "characters", MAX_TEXT_LENGTH)));
            }
            else
            {
                msg.text = text;
            }
        }
    }

    if(!errors.empty())
    {
        return std::unexpected(std::move(errors));
    }
    return msg;
}

MessageValidator::Result
MessageValidator::validateBody(std::string_view raw_body) const
{
    nlohmann::json payload = nlohmann::json::parse(raw_body, nullptr, false);
    if(payload.is_discarded())
    {
        return std::unexpected(std::vector<ValidationError>{
                {{"body"}, "Invalid JSON"}});
    }
    return validate(payload);
}
