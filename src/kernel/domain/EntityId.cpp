/**
 * @file EntityId.cpp
 * @brief EntityId implementation backed by libuuid
 */

#include "kernel/domain/EntityId.hpp"
#include "kernel/exception/DomainException.hpp"

#include <uuid/uuid.h>

#include <algorithm>
#include <iterator>

namespace kernel::domain {

EntityId EntityId::generate() {
    uuid_t uuid;
    uuid_generate_random(uuid);

    Bytes bytes;
    std::copy(std::begin(uuid), std::end(uuid), bytes.begin());
    return EntityId(bytes);
}

EntityId EntityId::parse(const std::string& text) {
    // uuid_parse also checks the length, but stops at an embedded NUL
    if (text.length() != 36) {
        throw exception::DomainException(
            "INVALID_ENTITY_ID", "Entity identifier must be 36 characters: '" + text + "'");
    }

    uuid_t uuid;
    if (uuid_parse(text.c_str(), uuid) != 0) {
        throw exception::DomainException(
            "INVALID_ENTITY_ID", "Entity identifier is not a valid UUID: '" + text + "'");
    }

    Bytes bytes;
    std::copy(std::begin(uuid), std::end(uuid), bytes.begin());
    return EntityId(bytes);
}

bool EntityId::isEmpty() const noexcept {
    return uuid_is_null(bytes_.data()) != 0;
}

std::string EntityId::toString() const {
    char str[37];
    uuid_unparse_lower(bytes_.data(), str);
    return std::string(str);
}

} // namespace kernel::domain
