#include "ingestion_pipeline.hpp"

#include <string_view>

#include <mw/error.hpp>
#include <spdlog/spdlog.h>

const char* outcomeLabel(IngestOutcome::Kind kind)
{
    switch(kind)
    {
    case IngestOutcome::CREATED:
        return "created";
    case IngestOutcome::DUPLICATE:
        return "duplicate";
    case IngestOutcome::INVALID_SIGNATURE:
        return "invalid_signature";
    case IngestOutcome::VALIDATION_ERROR:
        return "validation_error";
    }
    return "unknown";
}

IngestionPipeline::IngestionPipeline(MessageStoreInterface& store,
                                     const Config& config)
        : store(store), config(config)
{
}

mw::E<IngestOutcome> IngestionPipeline::handle(std::string_view raw_body,
                                               std::string_view signature) const
{
    return handle(raw_body, signature, config.webhook_secret);
}

mw::E<IngestOutcome> IngestionPipeline::handle(std::string_view raw_body,
                                               std::string_view signature,
                                               std::string_view secret) const
{
    if(!verifier.verify(raw_body, signature, secret))
    {
        return IngestOutcome::invalidSignature();
    }

    MessageValidator::Result msg = validator.validateBody(raw_body);
    if(!msg.has_value())
    {
        return IngestOutcome::validationError(std::move(msg).error());
    }

    ASSIGN_OR_RETURN(InsertOutcome inserted, store.insertMessage(*msg));
    switch(inserted)
    {
    case InsertOutcome::CREATED:
        return IngestOutcome::created(std::move(msg->message_id));
    case InsertOutcome::ALREADY_EXISTS:
        spdlog::debug("Message {} already exists.", msg->message_id);
        return IngestOutcome::duplicate(std::move(msg->message_id));
    }
    return std::unexpected(mw::runtimeError("Unknown insert outcome"));
}
