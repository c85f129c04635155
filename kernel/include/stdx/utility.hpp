#pragma once

#include <Lumen/common.hpp>

#include <new>
#include <utility>

namespace stdx
{
    template<typename T>
    class lazy_initializer {
        public:
        constexpr lazy_initializer(): _initialized{false}, _storage{} {}

        template<typename... Args>
        T& init(Args&&... args){
            if(_initialized)
                return *get();

            new (&_storage) T{std::forward<Args>(args)...};
            _initialized = true;

            return *get();
        }

        explicit operator bool() const {
            return _initialized;
        }

        T* get(){
            if(_initialized)
                return std::launder(reinterpret_cast<T*>(_storage));

            PANIC("Tried to get() uninitialized variable");
        }

        private:
        bool _initialized;
        alignas(T) unsigned char _storage[sizeof(T)];
    };
} // namespace stdx
