#pragma once

// Single-owner wrapper for C and OS resources.
//
// `Traits` provides `value_type`, `invalid()` and `close(value)`. The
// wrapper closes the value exactly once unless it was released first.

#include <cstdio>

#if defined(_WIN32)
#include <Windows.h>
#endif

namespace rl::core
{
    template<typename Traits>
    class UniqueResource final
    {
    public:
        using value_type = typename Traits::value_type;

        UniqueResource() noexcept = default;

        explicit UniqueResource(const value_type value) noexcept :
            _value(value)
        {
        }

        ~UniqueResource() noexcept
        {
            reset();
        }

        UniqueResource(const UniqueResource&) = delete;
        UniqueResource& operator=(const UniqueResource&) = delete;

        UniqueResource(UniqueResource&& other) noexcept :
            _value(other.release())
        {
        }

        UniqueResource& operator=(UniqueResource&& other) noexcept
        {
            if (this != &other)
            {
                reset(other.release());
            }
            return *this;
        }

        [[nodiscard]] value_type get() const noexcept
        {
            return _value;
        }

        [[nodiscard]] bool valid() const noexcept
        {
            return Traits::is_valid(_value);
        }

        [[nodiscard]] value_type release() noexcept
        {
            const value_type detached = _value;
            _value = Traits::invalid();
            return detached;
        }

        void reset(const value_type replacement = Traits::invalid()) noexcept
        {
            if (Traits::is_valid(_value))
            {
                Traits::close(_value);
            }
            _value = replacement;
        }

    private:
        value_type _value{ Traits::invalid() };
    };

    struct FileTraits final
    {
        using value_type = std::FILE*;

        static constexpr value_type invalid() noexcept
        {
            return nullptr;
        }

        static bool is_valid(const value_type value) noexcept
        {
            return value != nullptr;
        }

        static void close(const value_type value) noexcept
        {
            (void)std::fclose(value);
        }
    };

    using UniqueFile = UniqueResource<FileTraits>;

#if defined(_WIN32)
    // Both null and INVALID_HANDLE_VALUE mean "no handle"; Win32 APIs use either.
    struct HandleTraits final
    {
        using value_type = HANDLE;

        static value_type invalid() noexcept
        {
            return nullptr;
        }

        static bool is_valid(const value_type value) noexcept
        {
            return value != nullptr && value != INVALID_HANDLE_VALUE;
        }

        static void close(const value_type value) noexcept
        {
            (void)::CloseHandle(value);
        }
    };

    using UniqueHandle = UniqueResource<HandleTraits>;
#endif
}
