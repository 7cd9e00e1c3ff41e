#pragma once

#include "saltuid/core/SaltRegistry.h"

namespace saltuid::core {

template<typename T>
Identifiable<T>::Identifiable()
    : m_id(defaultGenerator().next()) {}

template<typename T>
Identifiable<T>::Identifiable(UIDGenerator &generator)
    : m_id(generator.next()) {}

template<typename T>
Identifiable<T>::Identifiable(UID id)
    : m_id(id) {}

template<typename T>
Handle<T> Identifiable<T>::getHandle() const {
    return Handle<T>(m_id);
}

} // namespace saltuid::core
