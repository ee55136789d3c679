/**
 * @file Entity.cpp
 * @brief Entity identity assignment
 */

#include "kernel/domain/Entity.hpp"
#include "kernel/exception/InvalidOperationException.hpp"

#include <spdlog/spdlog.h>

#include <typeinfo>

namespace kernel::domain {

void Entity::assignIdentity() {
    if (!id_.isEmpty()) {
        spdlog::warn("Rejected identity reassignment for entity {} ({})",
                     id_.toString(), typeid(*this).name());
        throw exception::InvalidOperationException(
            "An identity for this entity has already been established and cannot be changed");
    }

    id_ = EntityId::generate();
    spdlog::debug("Entity identity established: {}", id_.toString());
}

Entity::Entity(Entity&& other) noexcept
    : id_(other.id_) {
    other.id_ = EntityId::empty();
}

Entity& Entity::operator=(Entity&& other) {
    if (this == &other) {
        return *this;
    }
    if (hasIdentity()) {
        spdlog::warn("Rejected move assignment over established identity {} ({})",
                     id_.toString(), typeid(*this).name());
        throw exception::InvalidOperationException(
            "An identity for this entity has already been established and cannot be replaced");
    }

    id_ = other.id_;
    other.id_ = EntityId::empty();
    return *this;
}

bool Entity::operator==(const Entity& other) const {
    if (this == &other) {
        return true;
    }
    if (!hasIdentity() || !other.hasIdentity()) {
        return false;
    }
    if (typeid(*this) != typeid(other)) {
        return false;
    }
    return id_ == other.id_;
}

} // namespace kernel::domain
