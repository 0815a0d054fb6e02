/**
 * @file test_event_handler_registry.cpp
 * @brief Unit tests for EventHandlerRegistry and DispatchingEventPublisher
 */

#include <gtest/gtest.h>

#include "taskcore/infrastructure/messaging/DispatchingEventPublisher.hpp"
#include "taskcore/infrastructure/messaging/LoggingEventPublisher.hpp"
#include "taskcore/shared/event/EventHandlerRegistry.hpp"
#include "test_helpers.h"

#include <exception>
#include <stdexcept>

using taskcore::infrastructure::messaging::DispatchingEventPublisher;
using taskcore::infrastructure::messaging::LoggingEventPublisher;
using taskcore::shared::event::EventHandlerRegistry;
using taskcore::shared::exception::PublishException;
using namespace test_helpers;

class EventHandlerRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<EventHandlerRegistry> registry_ = std::make_shared<EventHandlerRegistry>();
    std::vector<std::string> received_;

    EventHandlerRegistry::Handler recorder(const std::string& name) {
        return [this, name](const DomainEvent& event) {
            received_.push_back(name + ":" + event.getEventType());
        };
    }
};

// ============================================================================
// Subscription
// ============================================================================

TEST_F(EventHandlerRegistryTest, Subscribe_RejectsEmptyTypeOrHandler) {
    EXPECT_THROW(registry_->subscribe("", recorder("a")), std::invalid_argument);
    EXPECT_THROW(registry_->subscribe("TaskCreated", EventHandlerRegistry::Handler()), std::invalid_argument);
    EXPECT_TRUE(registry_->registeredTypes().empty());
}

TEST_F(EventHandlerRegistryTest, Subscribe_ManyTypesSortedByName) {
    registry_->subscribe(std::vector<std::string>{"TaskUpdated", "TaskCreated"}, recorder("audit"));

    EXPECT_TRUE(registry_->isRegistered("TaskCreated"));
    EXPECT_FALSE(registry_->isRegistered("TaskRemoved"));
    EXPECT_EQ(registry_->registeredTypes(), (std::vector<std::string>{"TaskCreated", "TaskUpdated"}));
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(EventHandlerRegistryTest, Dispatch_InvokesHandlersInSubscriptionOrder) {
    registry_->subscribe("TaskCreated", recorder("first"));
    registry_->subscribe("TaskCreated", recorder("second"));
    registry_->subscribe("TaskUpdated", recorder("other"));

    EXPECT_EQ(registry_->dispatch(makeEvent("TaskCreated")), 2u);
    EXPECT_EQ(received_, (std::vector<std::string>{"first:TaskCreated", "second:TaskCreated"}));
}

TEST_F(EventHandlerRegistryTest, Dispatch_UnknownTypeCountedNotThrown) {
    EXPECT_EQ(registry_->dispatch(makeEvent("SomethingElse")), 0u);
    EXPECT_EQ(registry_->dispatch(makeEvent("SomethingElse")), 0u);
    EXPECT_EQ(registry_->unhandledCount(), 2u);
}

TEST_F(EventHandlerRegistryTest, Dispatch_HandlerFailureWrappedWithCause) {
    registry_->subscribe("TaskCreated", [](const DomainEvent&) {
        throw std::runtime_error("projection offline");
    });
    registry_->subscribe("TaskCreated", recorder("never"));

    try {
        registry_->dispatch(makeEvent("TaskCreated", "project-1", "e-42"));
        FAIL() << "expected PublishException";
    } catch (const PublishException& e) {
        EXPECT_NE(std::string(e.what()).find("e-42"), std::string::npos);
        EXPECT_THROW(std::rethrow_if_nested(e), std::runtime_error);
    }
    EXPECT_TRUE(received_.empty());
}

// ============================================================================
// Publishers
// ============================================================================

TEST_F(EventHandlerRegistryTest, DispatchingPublisher_RoutesEveryEvent) {
    registry_->subscribe("TaskCreated", recorder("h"));
    registry_->subscribe("TaskAssigned", recorder("h"));
    DispatchingEventPublisher publisher(registry_);

    publisher.publishAll({makeEvent("TaskCreated"), makeEvent("TaskAssigned"), makeEvent("TaskRemoved")});

    EXPECT_EQ(received_, (std::vector<std::string>{"h:TaskCreated", "h:TaskAssigned"}));
    EXPECT_EQ(registry_->unhandledCount(), 1u);
}

TEST_F(EventHandlerRegistryTest, DispatchingPublisher_NullRegistryThrows) {
    EXPECT_THROW(DispatchingEventPublisher(nullptr), std::invalid_argument);
}

TEST_F(EventHandlerRegistryTest, LoggingPublisher_CountsEvents) {
    LoggingEventPublisher publisher;

    publisher.publishAll({makeEvent("TaskCreated"), makeEvent("TaskUpdated")});
    publisher.publishAll({});

    EXPECT_EQ(publisher.publishedCount(), 2u);
}
