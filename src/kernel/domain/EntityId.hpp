/**
 * @file EntityId.hpp
 * @brief Value Object for Entity identifiers
 */

#pragma once

#include "kernel/domain/ValueObject.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <string>

namespace kernel::domain {

/**
 * @brief 128-bit universally unique entity identifier
 *
 * The nil UUID (all zero bytes) is the "unset" sentinel carried by an
 * entity before its identity is established. New identifiers are random
 * UUID v4 values.
 */
class EntityId : public ValueObject<EntityId> {
public:
    static constexpr std::size_t SIZE = 16;
    using Bytes = std::array<unsigned char, SIZE>;

private:
    Bytes bytes_;

    explicit EntityId(const Bytes& bytes) noexcept : bytes_(bytes) {}

protected:
    void describeComponents(ValueComponents& components) const override {
        components.add(bytes_);
    }

public:
    /**
     * @brief Construct the nil (unset) identifier
     */
    EntityId() noexcept : bytes_{} {}

    /**
     * @brief The nil (unset) identifier
     */
    static EntityId empty() noexcept {
        return EntityId();
    }

    /**
     * @brief Generate a new random identifier (UUID v4)
     */
    static EntityId generate();

    /**
     * @brief Parse the canonical textual form
     * @param text e.g. "4f1c2d9e-8a7b-4c3d-9e0f-1a2b3c4d5e6f"
     * @throws kernel::exception::DomainException INVALID_ENTITY_ID on malformed input
     */
    static EntityId parse(const std::string& text);

    /**
     * @brief Check for the nil sentinel
     */
    [[nodiscard]] bool isEmpty() const noexcept;

    [[nodiscard]] const Bytes& getBytes() const noexcept {
        return bytes_;
    }

    /**
     * @brief Lowercase canonical form (36 characters)
     */
    [[nodiscard]] std::string toString() const;

    bool operator<(const EntityId& other) const noexcept {
        return bytes_ < other.bytes_;
    }
};

} // namespace kernel::domain

// Hash specialization for EntityId
namespace std {
    template<>
    struct hash<kernel::domain::EntityId> {
        size_t operator()(const kernel::domain::EntityId& id) const {
            return id.hashCode();
        }
    };
}
