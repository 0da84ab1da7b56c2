#include "allocation_failure.hpp"

#include <atomic>
#include <cstdlib>
#include <new>

namespace
{
    std::atomic<bool> g_fail_allocations{ false };
}

namespace rl::tests
{
    void fail_allocations() noexcept
    {
        g_fail_allocations.store(true, std::memory_order_relaxed);
    }

    AllocationFailureScope::AllocationFailureScope() noexcept
    {
        g_fail_allocations.store(false, std::memory_order_relaxed);
    }

    AllocationFailureScope::~AllocationFailureScope() noexcept
    {
        g_fail_allocations.store(false, std::memory_order_relaxed);
    }
}

void* operator new(std::size_t size)
{
    if (g_fail_allocations.load(std::memory_order_relaxed))
    {
        throw std::bad_alloc();
    }

    if (void* memory = std::malloc(size == 0 ? 1 : size))
    {
        return memory;
    }
    throw std::bad_alloc();
}

void operator delete(void* memory) noexcept
{
    std::free(memory);
}

void operator delete(void* memory, std::size_t) noexcept
{
    std::free(memory);
}
