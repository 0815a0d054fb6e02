#include "taskcore/shared/error/ErrorClassification.hpp"
#include "taskcore/shared/exception/ApplicationException.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/exception/InfrastructureException.hpp"

#include <stdexcept>

namespace taskcore::shared::error {

std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
        case ErrorCategory::NOT_FOUND: return "NOT_FOUND";
        case ErrorCategory::CONCURRENCY_CONFLICT: return "CONCURRENCY_CONFLICT";
        case ErrorCategory::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCategory::PERSISTENCE_FAILURE: return "PERSISTENCE_FAILURE";
        case ErrorCategory::POST_COMMIT_PUBLISH: return "POST_COMMIT_PUBLISH";
        case ErrorCategory::INTERNAL: return "INTERNAL";
    }
    return "INTERNAL";
}

ErrorClassification classifyError(const std::exception& e) {
    using namespace exception;

    if (const auto* notFound = dynamic_cast<const NotFoundException*>(&e)) {
        return {ErrorCategory::NOT_FOUND, notFound->getCode(), 404, true};
    }
    if (const auto* invariant = dynamic_cast<const InvariantViolationException*>(&e)) {
        return {ErrorCategory::INVARIANT_VIOLATION, invariant->getCode(), 422, true};
    }
    if (const auto* validation = dynamic_cast<const ValidationException*>(&e)) {
        return {ErrorCategory::INVALID_REQUEST, validation->getCode(), 400, true};
    }
    if (const auto* notAssignee = dynamic_cast<const NotTaskAssigneeException*>(&e)) {
        return {ErrorCategory::INVARIANT_VIOLATION, notAssignee->getCode(), 403, true};
    }
    if (const auto* domain = dynamic_cast<const DomainException*>(&e)) {
        // Illegal transitions and retry timing are state conflicts
        return {ErrorCategory::INVARIANT_VIOLATION, domain->getCode(), 409, true};
    }
    if (const auto* conflict = dynamic_cast<const ConcurrencyConflictException*>(&e)) {
        return {ErrorCategory::CONCURRENCY_CONFLICT, conflict->getCode(), 409, true};
    }
    if (const auto* postCommit = dynamic_cast<const PostCommitPublishException*>(&e)) {
        return {ErrorCategory::POST_COMMIT_PUBLISH, postCommit->getCode(), 500, false};
    }
    if (const auto* config = dynamic_cast<const ConfigException*>(&e)) {
        return {ErrorCategory::INTERNAL, config->getCode(), 500, false};
    }
    if (const auto* infrastructure = dynamic_cast<const InfrastructureException*>(&e)) {
        return {ErrorCategory::PERSISTENCE_FAILURE, infrastructure->getCode(), 500, false};
    }
    if (const auto* application = dynamic_cast<const ApplicationException*>(&e)) {
        return {ErrorCategory::INVALID_REQUEST, application->getCode(), 400, true};
    }
    if (dynamic_cast<const std::invalid_argument*>(&e) != nullptr) {
        return {ErrorCategory::INVALID_REQUEST, "INVALID_ARGUMENT", 400, true};
    }
    return {ErrorCategory::INTERNAL, "INTERNAL_ERROR", 500, false};
}

} // namespace taskcore::shared::error
