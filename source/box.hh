// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <memory>
#include <utility>

namespace gqlc {
    // Owning indirection with value semantics; lets generated types refer to
    // themselves (directly or through a cycle) while remaining copyable.
    template <typename T>
    class Box {
    public:
        Box() : _ptr(std::make_unique<T>()) {}
        Box(T const& value) : _ptr(std::make_unique<T>(value)) {}
        Box(T&& value) : _ptr(std::make_unique<T>(std::move(value))) {}

        Box(Box const& rhs) : _ptr(std::make_unique<T>(*rhs._ptr)) {}
        // a moved-from Box holds a default T, never null
        Box(Box&& rhs) : _ptr(std::make_unique<T>()) { _ptr.swap(rhs._ptr); }

        Box& operator=(Box const& rhs) {
            if (this != &rhs)
                _ptr = std::make_unique<T>(*rhs._ptr);
            return *this;
        }
        Box& operator=(Box&& rhs) noexcept {
            _ptr.swap(rhs._ptr);
            return *this;
        }

        T& operator*() noexcept { return *_ptr; }
        T const& operator*() const noexcept { return *_ptr; }
        T* operator->() noexcept { return _ptr.get(); }
        T const* operator->() const noexcept { return _ptr.get(); }

        T* get() noexcept { return _ptr.get(); }
        T const* get() const noexcept { return _ptr.get(); }

    private:
        std::unique_ptr<T> _ptr;
    };
}
