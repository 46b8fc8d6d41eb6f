#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <mw/error.hpp>

#include "config.hpp"
#include "message_store.hpp"
#include "message_validator.hpp"
#include "signature_verifier.hpp"
#include "types.hpp"

struct IngestOutcome
{
    enum Kind { CREATED, DUPLICATE, INVALID_SIGNATURE, VALIDATION_ERROR };
    Kind kind;
    // Only for VALIDATION_ERROR.
    std::vector<ValidationError> errors;
    // Only for CREATED and DUPLICATE.
    std::string message_id;

    static IngestOutcome created(std::string id)
    {
        return {CREATED, {}, std::move(id)};
    }

    static IngestOutcome duplicate(std::string id)
    {
        return {DUPLICATE, {}, std::move(id)};
    }

    static IngestOutcome invalidSignature()
    {
        return {INVALID_SIGNATURE, {}, {}};
    }

    static IngestOutcome validationError(std::vector<ValidationError>&& errs)
    {
        return {VALIDATION_ERROR, std::move(errs), {}};
    }
};

// The result label of an outcome, as used by the webhook counter and
// the logs: “created”, “duplicate”, “invalid_signature” or
// “validation_error”.
const char* outcomeLabel(IngestOutcome::Kind kind);

// Verify → validate → persist, for one inbound event. The store is
// only touched once the signature and the payload are both good. A
// storage failure comes back as an error, never as one of the
// outcomes.
class IngestionPipeline
{
public:
    IngestionPipeline(MessageStoreInterface& store, const Config& config);

    // Use the configured secret.
    mw::E<IngestOutcome> handle(std::string_view raw_body,
                                std::string_view signature) const;
    mw::E<IngestOutcome> handle(std::string_view raw_body,
                                std::string_view signature,
                                std::string_view secret) const;

private:
    MessageStoreInterface& store;
    const Config& config;
    SignatureVerifier verifier;
    MessageValidator validator;
};
