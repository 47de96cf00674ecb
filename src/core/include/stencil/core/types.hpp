#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace stencil {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using usize = std::size_t;

// ============================================================================
// Result<T, E> - fallible return value; compilation never throws
//
//   Result<String, CompileError> r = make_error(CompileError{...});
//   if (!r) { return make_error(std::move(r).error()); }
// ============================================================================

// Tags a value as the failure case, so Result<String, String> stays unambiguous
template<typename E>
struct Error {
    E value;
};

template<typename E>
[[nodiscard]] Error<std::decay_t<E>> make_error(E&& error) {
    return Error<std::decay_t<E>>{std::forward<E>(error)};
}

template<typename T, typename E>
class Result {
    template<typename U>
    static constexpr bool accepts_value =
        !std::is_same_v<std::remove_cvref_t<U>, Result> &&
        !std::is_same_v<std::remove_cvref_t<U>, Error<E>> &&
        std::is_constructible_v<T, U>;

public:
    template<typename U = T, std::enable_if_t<accepts_value<U>, int> = 0>
    Result(U&& value)
        : m_storage(std::in_place_index<0>, std::forward<U>(value))
    {
    }

    Result(Error<E> failure)
        : m_storage(std::in_place_index<1>, std::move(failure.value))
    {
    }

    [[nodiscard]] bool is_ok() const noexcept { return m_storage.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_storage.index() == 1; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(m_storage); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_storage); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_storage)); }

    [[nodiscard]] E& error() & { return std::get<1>(m_storage); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_storage); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(m_storage)); }

private:
    std::variant<T, E> m_storage;
};

// Success carries nothing; only the failure is stored
template<typename E>
class Result<void, E> {
public:
    Result() = default;

    Result(Error<E> failure)
        : m_failure(std::move(failure.value))
    {
    }

    [[nodiscard]] bool is_ok() const noexcept { return !m_failure.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_failure.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_failure; }
    [[nodiscard]] const E& error() const& { return *m_failure; }
    [[nodiscard]] E&& error() && { return std::move(*m_failure); }

private:
    std::optional<E> m_failure;
};

// ============================================================================
// RefCounted / RefPtr - shared ownership of DOM nodes
// ============================================================================

class RefCounted {
public:
    RefCounted() = default;
    RefCounted(const RefCounted&) {}
    RefCounted& operator=(const RefCounted&) { return *this; }
    virtual ~RefCounted() = default;

    void retain() const noexcept { m_count.fetch_add(1, std::memory_order_relaxed); }

    // Deletes the object when the last reference goes away
    void release() const noexcept {
        if (m_count.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            delete this;
        }
    }

    [[nodiscard]] u32 ref_count() const noexcept { return m_count.load(std::memory_order_relaxed); }

private:
    mutable std::atomic<u32> m_count{0};
};

template<typename T>
class RefPtr {
public:
    RefPtr() noexcept = default;
    RefPtr(std::nullptr_t) noexcept {}

    // Adopts a fresh object or shares an existing one; either way takes a reference
    explicit RefPtr(T* object) noexcept
        : m_object(object)
    {
        if (m_object) m_object->retain();
    }

    RefPtr(const RefPtr& other) noexcept
        : RefPtr(other.m_object)
    {
    }

    RefPtr(RefPtr&& other) noexcept
        : m_object(std::exchange(other.m_object, nullptr))
    {
    }

    // Upcast, e.g. RefPtr<Element> -> RefPtr<Node>
    template<typename U, std::enable_if_t<std::is_convertible_v<U*, T*>, int> = 0>
    RefPtr(const RefPtr<U>& other) noexcept
        : RefPtr(static_cast<T*>(other.get()))
    {
    }

    ~RefPtr() {
        if (m_object) m_object->release();
    }

    // Copy-and-swap; covers self-assignment and nullptr
    RefPtr& operator=(RefPtr other) noexcept {
        std::swap(m_object, other.m_object);
        return *this;
    }

    [[nodiscard]] T* get() const noexcept { return m_object; }
    [[nodiscard]] T* operator->() const noexcept { return m_object; }
    [[nodiscard]] T& operator*() const noexcept { return *m_object; }
    [[nodiscard]] explicit operator bool() const noexcept { return m_object != nullptr; }

    [[nodiscard]] bool operator==(const RefPtr&) const = default;
    [[nodiscard]] bool operator==(std::nullptr_t) const noexcept { return m_object == nullptr; }

private:
    T* m_object{nullptr};
};

template<typename T, typename... Args>
[[nodiscard]] RefPtr<T> make_ref(Args&&... args) {
    return RefPtr<T>(new T(std::forward<Args>(args)...));
}

} // namespace stencil
