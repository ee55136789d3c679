/**
 * @file ValueComponents.hpp
 * @brief Type-erased component list used by structural equality
 *
 * A value type describes itself as an ordered list of components (its
 * stored attribute values). Each component keeps a pointer to the member
 * plus the equality and hash functions for the member's type, so two
 * instances can be compared without the base class knowing their shape.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace kernel::domain {

class ValueObjectBase;

/// Initial value of every structural hash.
inline constexpr std::size_t HASH_CODE_SEED = 17;

/// Multiplier applied before adding each component hash.
inline constexpr std::size_t HASH_CODE_MULTIPLIER = 59;

namespace detail {

template<typename T>
struct AlwaysFalse : std::false_type {};

template<typename T, typename = void>
struct IsStdHashable : std::false_type {};

// Disabled std::hash specializations are not default constructible.
template<typename T>
struct IsStdHashable<T, std::void_t<decltype(std::hash<T>{}(std::declval<const T&>()))>>
    : std::is_default_constructible<std::hash<T>> {};

template<typename T, typename = void>
struct IsIterable : std::false_type {};

template<typename T>
struct IsIterable<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                                 decltype(std::end(std::declval<const T&>()))>>
    : std::true_type {};

// Hashed containers compare as sets, so their iteration order is unspecified
template<typename T, typename = void>
struct IsUnorderedContainer : std::false_type {};

template<typename T>
struct IsUnorderedContainer<T, std::void_t<typename T::key_type, typename T::hasher>>
    : std::true_type {};

template<typename T>
struct IsPair : std::false_type {};

template<typename First, typename Second>
struct IsPair<std::pair<First, Second>> : std::true_type {};

template<typename T, typename = void>
struct IsEqualityComparable : std::false_type {};

template<typename T>
struct IsEqualityComparable<T, std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>>
    : std::true_type {};

/**
 * @brief Holders whose empty state marks an absent component
 *
 * Present values are compared through the pointee, never by address.
 */
template<typename T>
struct NullableTraits {
    static constexpr bool isNullable = false;
};

template<typename T>
struct NullableTraits<std::optional<T>> {
    static constexpr bool isNullable = true;
    using ValueType = std::remove_cv_t<T>;

    static const ValueType* get(const std::optional<T>& holder) noexcept {
        return holder.has_value() ? &*holder : nullptr;
    }
};

template<typename T>
struct NullableTraits<std::shared_ptr<T>> {
    static constexpr bool isNullable = true;
    using ValueType = std::remove_cv_t<T>;

    static const ValueType* get(const std::shared_ptr<T>& holder) noexcept {
        return holder.get();
    }
};

template<typename T, typename Deleter>
struct NullableTraits<std::unique_ptr<T, Deleter>> {
    static constexpr bool isNullable = true;
    using ValueType = std::remove_cv_t<T>;

    static const ValueType* get(const std::unique_ptr<T, Deleter>& holder) noexcept {
        return holder.get();
    }
};

template<typename T>
struct NullableTraits<T*> {
    static constexpr bool isNullable = true;
    using ValueType = std::remove_cv_t<T>;

    static_assert(!std::is_same_v<ValueType, char>,
                  "C string components compare a single character; store std::string instead");

    static const ValueType* get(T* holder) noexcept {
        return holder;
    }
};

template<typename V>
std::size_t hashValue(const V& value) {
    if constexpr (std::is_base_of_v<ValueObjectBase, V>) {
        return value.hashCode();
    } else if constexpr (IsStdHashable<V>::value) {
        return std::hash<V>{}(value);
    } else if constexpr (NullableTraits<V>::isNullable) {
        const auto* target = NullableTraits<V>::get(value);
        return target == nullptr ? 0 : hashValue(*target);
    } else if constexpr (IsPair<V>::value) {
        std::size_t hash = HASH_CODE_SEED;
        hash = hash * HASH_CODE_MULTIPLIER + hashValue(value.first);
        hash = hash * HASH_CODE_MULTIPLIER + hashValue(value.second);
        return hash;
    } else if constexpr (IsUnorderedContainer<V>::value) {
        // Sum of element hashes does not depend on bucket order
        std::size_t sum = 0;
        for (const auto& element : value) {
            sum += hashValue(element);
        }
        return HASH_CODE_SEED * HASH_CODE_MULTIPLIER + sum;
    } else if constexpr (IsIterable<V>::value) {
        std::size_t hash = HASH_CODE_SEED;
        for (const auto& element : value) {
            hash = hash * HASH_CODE_MULTIPLIER + hashValue(element);
        }
        return hash;
    } else {
        static_assert(AlwaysFalse<V>::value,
                      "value component needs std::hash, a value object type, or an iterable of those");
        return 0;
    }
}

template<typename V>
bool equalValues(const V& first, const V& second) {
    if constexpr (std::is_base_of_v<ValueObjectBase, V>) {
        return first.equalsObject(&second);
    } else {
        static_assert(IsEqualityComparable<V>::value, "value component needs operator==");
        return first == second;
    }
}

} // namespace detail

/**
 * @brief One attribute value taking part in structural equality
 *
 * Only a view: it points at a member of the described object and is valid
 * while that object is alive and unmodified.
 */
class ValueComponent {
private:
    using EqualFn = bool (*)(const void*, const void*);
    using HashFn = std::size_t (*)(const void*);

    const void* value_;
    const std::type_info* type_;
    EqualFn equal_;
    HashFn hash_;

    ValueComponent(const void* value, const std::type_info& type, EqualFn equal, HashFn hash) noexcept
        : value_(value), type_(&type), equal_(equal), hash_(hash) {}

    template<typename V>
    static ValueComponent ofPointer(const V* value) {
        return ValueComponent(
            value,
            typeid(V),
            [](const void* first, const void* second) {
                return detail::equalValues(*static_cast<const V*>(first), *static_cast<const V*>(second));
            },
            [](const void* target) {
                return detail::hashValue(*static_cast<const V*>(target));
            });
    }

public:
    /**
     * @brief Build a component view over a stored member
     *
     * Nullable holders (optional, smart and raw pointers) are unwrapped;
     * an empty holder yields an absent component.
     */
    template<typename V>
    static ValueComponent of(const V& value) {
        using Traits = detail::NullableTraits<V>;
        if constexpr (Traits::isNullable) {
            return ofPointer<typename Traits::ValueType>(Traits::get(value));
        } else {
            return ofPointer<V>(&value);
        }
    }

    [[nodiscard]] bool isAbsent() const noexcept {
        return value_ == nullptr;
    }

    [[nodiscard]] const std::type_info& getType() const noexcept {
        return *type_;
    }

    /**
     * @brief Compare with the component at the same position of another instance
     *
     * Two absent components are equal; absent and present are not.
     */
    [[nodiscard]] bool equals(const ValueComponent& other) const {
        if (isAbsent() || other.isAbsent()) {
            return isAbsent() && other.isAbsent();
        }
        if (*type_ != *other.type_) {
            return false;
        }
        return equal_(value_, other.value_);
    }

    /**
     * @brief Hash of the component value, 0 when absent
     */
    [[nodiscard]] std::size_t hash() const {
        return isAbsent() ? 0 : hash_(value_);
    }
};

/**
 * @brief Ordered component list filled by ValueObjectBase::describeComponents
 */
class ValueComponents {
private:
    std::vector<ValueComponent> components_;

public:
    using const_iterator = std::vector<ValueComponent>::const_iterator;

    /**
     * @brief Append components in declaration order
     *
     * Arguments must be stored members; temporaries would dangle.
     */
    template<typename... Values>
    ValueComponents& add(Values&&... values) {
        static_assert((std::is_lvalue_reference_v<Values> && ...),
                      "components must refer to stored members, not temporaries");
        (components_.push_back(ValueComponent::of(values)), ...);
        return *this;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return components_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return components_.empty();
    }

    [[nodiscard]] const ValueComponent& operator[](std::size_t index) const {
        return components_[index];
    }

    [[nodiscard]] const_iterator begin() const noexcept {
        return components_.begin();
    }

    [[nodiscard]] const_iterator end() const noexcept {
        return components_.end();
    }

    /**
     * @brief Pairwise comparison, stopping at the first unequal component
     */
    [[nodiscard]] bool equals(const ValueComponents& other) const {
        if (components_.size() != other.components_.size()) {
            return false;
        }
        for (std::size_t i = 0; i < components_.size(); ++i) {
            if (!components_[i].equals(other.components_[i])) {
                return false;
            }
        }
        return true;
    }
};

} // namespace kernel::domain
