/**
 * @file test_entity.cpp
 * @brief Unit tests for Entity identity assignment
 */

#include <gtest/gtest.h>
#include "test_helpers.h"
#include "kernel/exception/InvalidOperationException.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <memory>
#include <string>
#include <utility>

using namespace test_helpers;
using kernel::domain::EntityId;
using kernel::exception::DomainException;
using kernel::exception::InvalidOperationException;

class EntityTest : public ::testing::Test {
protected:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    std::shared_ptr<spdlog::logger> previous_;

    void SetUp() override {
        previous_ = spdlog::default_logger();
        sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
        sink_->set_pattern("[%l] %v");
        auto logger = std::make_shared<spdlog::logger>("entity-test", sink_);
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);
    }

    void TearDown() override {
        spdlog::set_default_logger(previous_);
    }
};

TEST_F(EntityTest, Fresh_HasNoIdentity) {
    DraftOrder draft;
    EXPECT_FALSE(draft.hasIdentity());
    EXPECT_TRUE(draft.getId().isEmpty());
    EXPECT_EQ(draft.getId(), EntityId::empty());
}

TEST_F(EntityTest, AssignIdentity_EstablishesNonEmptyId) {
    DraftOrder draft;
    draft.establishIdentity();

    EXPECT_TRUE(draft.hasIdentity());
    EXPECT_FALSE(draft.getId().isEmpty());
    EXPECT_EQ(draft.getId().toString().length(), 36u);
}

TEST_F(EntityTest, AssignIdentity_FromConstructor_DoesNotThrow) {
    EXPECT_NO_THROW(Order());
    Order order;
    EXPECT_TRUE(order.hasIdentity());
}

TEST_F(EntityTest, TwoOrders_HaveDistinctIdentities) {
    Order first;
    Order second;

    EXPECT_FALSE(first.getId().isEmpty());
    EXPECT_FALSE(second.getId().isEmpty());
    EXPECT_NE(first.getId(), second.getId());
}

TEST_F(EntityTest, Reassign_ThrowsInvalidOperation) {
    Order order;
    EXPECT_THROW(order.reassignIdentity(), InvalidOperationException);
}

TEST_F(EntityTest, Reassign_LeavesIdentityUnchanged) {
    Order order;
    const EntityId original = order.getId();

    try {
        order.reassignIdentity();
        FAIL() << "Expected InvalidOperationException";
    } catch (const InvalidOperationException& e) {
        EXPECT_EQ(e.getCode(), "INVALID_OPERATION");
        EXPECT_NE(std::string(e.what()).find("already been established"), std::string::npos);
    }

    EXPECT_EQ(order.getId(), original);
}

TEST_F(EntityTest, Reassign_IsADomainException) {
    DraftOrder draft;
    draft.establishIdentity();
    EXPECT_THROW(draft.establishIdentity(), DomainException);
}

TEST_F(EntityTest, AssignIdentity_LogsNewIdentifier) {
    Order order;

    auto lines = sink_->last_formatted();
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("[debug]"), std::string::npos);
    EXPECT_NE(lines.back().find(order.getId().toString()), std::string::npos);
}

TEST_F(EntityTest, Reassign_LogsWarning) {
    Order order;
    EXPECT_THROW(order.reassignIdentity(), InvalidOperationException);

    auto lines = sink_->last_formatted();
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("[warning]"), std::string::npos);
    EXPECT_NE(lines.back().find(order.getId().toString()), std::string::npos);
}

// ============================================================================
// Identity equality
// ============================================================================

TEST_F(EntityTest, Equality_SameInstance) {
    Order order;
    EXPECT_TRUE(order == order);

    DraftOrder draft;
    EXPECT_TRUE(draft == draft);
}

TEST_F(EntityTest, Equality_DistinctIdentities_AreNotEqual) {
    Order first;
    Order second;
    EXPECT_TRUE(first != second);
}

TEST_F(EntityTest, Equality_TransientEntities_AreNotEqual) {
    DraftOrder first;
    DraftOrder second;
    EXPECT_FALSE(first == second);
}

TEST_F(EntityTest, Equality_DifferentEntityTypes_AreNotEqual) {
    Order order;
    Shipment shipment;
    EXPECT_FALSE(order == shipment);
}

TEST_F(EntityTest, Move_KeepsIdentity) {
    Order order;
    const EntityId original = order.getId();

    Order moved(std::move(order));
    EXPECT_EQ(moved.getId(), original);
    EXPECT_THROW(moved.reassignIdentity(), InvalidOperationException);
}

TEST_F(EntityTest, Move_SourceLosesIdentity) {
    Order order;
    Order moved(std::move(order));

    EXPECT_FALSE(order.hasIdentity());
    EXPECT_TRUE(order.getId().isEmpty());
    EXPECT_FALSE(moved == order);
}

TEST_F(EntityTest, MoveAssign_OntoEstablishedIdentity_Throws) {
    Order target;
    const EntityId targetId = target.getId();
    Order source;
    const EntityId sourceId = source.getId();

    EXPECT_THROW(target = std::move(source), InvalidOperationException);

    EXPECT_EQ(target.getId(), targetId);
    EXPECT_EQ(source.getId(), sourceId);
    EXPECT_FALSE(target == source);
}

TEST_F(EntityTest, MoveAssign_OntoTransient_TransfersIdentity) {
    DraftOrder target;
    DraftOrder source;
    source.establishIdentity();
    const EntityId sourceId = source.getId();

    target = std::move(source);

    EXPECT_EQ(target.getId(), sourceId);
    EXPECT_FALSE(source.hasIdentity());
    EXPECT_FALSE(target == source);
}

TEST_F(EntityTest, MoveAssign_Self_KeepsIdentity) {
    Order order;
    const EntityId original = order.getId();
    Order& alias = order;

    EXPECT_NO_THROW(order = std::move(alias));
    EXPECT_EQ(order.getId(), original);
}
