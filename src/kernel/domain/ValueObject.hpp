/**
 * @file ValueObject.hpp
 * @brief Base class for Value Objects in DDD
 */

#pragma once

#include "kernel/domain/ValueComponents.hpp"

#include <cstddef>
#include <type_traits>
#include <typeinfo>

namespace kernel::domain {

/**
 * @brief Polymorphic root of all Value Objects
 *
 * Provides the untyped equality and hash entry points, so value objects of
 * unknown concrete type (e.g. a component held through a base pointer) can
 * still be compared structurally.
 */
class ValueObjectBase {
public:
    virtual ~ValueObjectBase() = default;

    /**
     * @brief Untyped structural equality
     * @return false when target is null or of another concrete type
     */
    [[nodiscard]] virtual bool equalsObject(const ValueObjectBase* target) const = 0;

    /**
     * @brief Structural hash over all components
     */
    [[nodiscard]] virtual std::size_t hashCode() const = 0;

protected:
    ValueObjectBase() = default;
    ValueObjectBase(const ValueObjectBase&) = default;
    ValueObjectBase& operator=(const ValueObjectBase&) = default;
    ValueObjectBase(ValueObjectBase&&) noexcept = default;
    ValueObjectBase& operator=(ValueObjectBase&&) noexcept = default;

    /**
     * @brief List the components that define this value
     *
     * A value type deriving from another value type must call the parent's
     * describeComponents first and then add its own members, so the list
     * always spans the whole inheritance chain.
     */
    virtual void describeComponents(ValueComponents& components) const = 0;
};

/**
 * @brief Base template class for Value Objects
 *
 * Value Objects are defined by their attributes: two instances of the same
 * concrete type with equal components are equal and hash identically.
 * Instances of different concrete types are never equal, even when one
 * derives from the other.
 *
 * @tparam TValueObject The concrete value type (CRTP)
 */
template<typename TValueObject>
class ValueObject : public ValueObjectBase {
private:
    static ValueComponents componentsOf(const ValueObject& object) {
        ValueComponents components;
        object.describeComponents(components);
        return components;
    }

protected:
    ValueObject() = default;

public:
    /**
     * @brief Typed structural equality against a nullable instance
     * @return false when other is null
     */
    [[nodiscard]] bool equals(const TValueObject* other) const {
        if (other == nullptr) {
            return false;
        }
        return equals(*other);
    }

    /**
     * @brief Typed structural equality
     *
     * Runtime types must match exactly; components are then compared
     * pairwise and the first mismatch ends the comparison.
     */
    [[nodiscard]] bool equals(const TValueObject& other) const {
        static_assert(std::is_base_of_v<ValueObject<TValueObject>, TValueObject>,
                      "TValueObject must derive from ValueObject<TValueObject>");

        const ValueObject& that = other;
        if (typeid(*this) != typeid(that)) {
            return false;
        }
        return componentsOf(*this).equals(componentsOf(that));
    }

    [[nodiscard]] bool equalsObject(const ValueObjectBase* target) const override {
        return equals(dynamic_cast<const TValueObject*>(target));
    }

    /**
     * @brief Fold component hashes: hash = hash * 59 + componentHash
     *
     * Starts from 17 and skips absent components.
     */
    [[nodiscard]] std::size_t hashCode() const override {
        std::size_t hash = HASH_CODE_SEED;
        for (const auto& component : componentsOf(*this)) {
            if (!component.isAbsent()) {
                hash = hash * HASH_CODE_MULTIPLIER + component.hash();
            }
        }
        return hash;
    }

    /**
     * @brief Equality over nullable handles
     *
     * Same address (including both null) is equal, exactly one null is not.
     */
    [[nodiscard]] static bool areEqual(const TValueObject* first, const TValueObject* second) {
        if (first == second) {
            return true;
        }
        if (first == nullptr || second == nullptr) {
            return false;
        }
        return first->equals(*second);
    }

    friend bool operator==(const ValueObject& first, const ValueObject& second) {
        if (&first == &second) {
            return true;
        }
        return first.equals(static_cast<const TValueObject&>(second));
    }

    friend bool operator!=(const ValueObject& first, const ValueObject& second) {
        return !(first == second);
    }
};

/**
 * @brief Hash functor for keying unordered containers with value objects
 */
struct ValueObjectHasher {
    std::size_t operator()(const ValueObjectBase& value) const {
        return value.hashCode();
    }
};

} // namespace kernel::domain
