/**
 * @file Entity.hpp
 * @brief Base class for Entities in DDD
 */

#pragma once

#include "kernel/domain/EntityId.hpp"

namespace kernel::domain {

/**
 * @brief Base class for Entities
 *
 * Entities are objects that are defined by their identity, not by their
 * attributes. The identity starts out unset and is established exactly
 * once, from the concrete entity's constructor, via assignIdentity().
 */
class Entity {
private:
    EntityId id_;

protected:
    /**
     * @brief Construct an entity without identity
     */
    Entity() = default;

    /**
     * @brief Establish the entity's identity
     *
     * Generates a new random identifier when none is set yet.
     *
     * @throws kernel::exception::InvalidOperationException if an identity
     *         has already been established; the identifier is left unchanged
     */
    void assignIdentity();

public:
    virtual ~Entity() = default;

    // Entities should not be copied, only moved
    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    /**
     * @brief Take over the identity; the source is left without one
     */
    Entity(Entity&& other) noexcept;

    /**
     * @brief Take over the identity of other
     *
     * The source is left without identity.
     *
     * @throws kernel::exception::InvalidOperationException if this entity
     *         already has an identity; both entities are left unchanged
     */
    Entity& operator=(Entity&& other);

    /**
     * @brief Get the entity's identifier (nil until assigned)
     */
    [[nodiscard]] const EntityId& getId() const noexcept {
        return id_;
    }

    [[nodiscard]] bool hasIdentity() const noexcept {
        return !id_.isEmpty();
    }

    /**
     * @brief Equality comparison based on identity
     *
     * Entities without identity are only equal to themselves.
     */
    bool operator==(const Entity& other) const;

    bool operator!=(const Entity& other) const {
        return !(*this == other);
    }
};

} // namespace kernel::domain
