#include <algorithm>
#include <cstddef>
#include <new>
#include <span>

#include "vellum/scratch_pool.hpp"

namespace vellum {

namespace {

// Zero-sized blocks still occupy one code unit,
// so that every acquisition yields a distinct pointer which can be released.
[[nodiscard]]
constexpr std::size_t allocation_size(std::size_t size) noexcept
{
    return std::max<std::size_t>(size, 1);
}

} // namespace

std::span<char8_t> Memory_Resource_Scratch_Pool::acquire(std::size_t size)
{
    void* const result = m_memory->allocate(allocation_size(size), alignof(char8_t));
    return { static_cast<char8_t*>(result), size };
}

void Memory_Resource_Scratch_Pool::release(std::span<char8_t> block) noexcept
{
    VELLUM_DEBUG_ASSERT(block.data());
    m_memory->deallocate(block.data(), allocation_size(block.size()), alignof(char8_t));
}

Global_Scratch_Pool* Global_Scratch_Pool::get()
{
    // Constructed into static storage and never destroyed,
    // so buffers disposed during static destruction can still release into it.
    alignas(Global_Scratch_Pool) static unsigned char storage[sizeof(Global_Scratch_Pool)];
    static Global_Scratch_Pool* const instance = ::new (static_cast<void*>(storage)) Global_Scratch_Pool;
    return instance;
}

} // namespace vellum
