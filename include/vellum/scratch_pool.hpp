#ifndef VELLUM_SCRATCH_POOL_HPP
#define VELLUM_SCRATCH_POOL_HPP

#include <cstddef>
#include <memory_resource>
#include <span>
#include <utility>

#include "vellum/util/assert.hpp"

#include "vellum/fwd.hpp"

namespace vellum {

/// @brief A pool of reusable scratch memory for transient copies of text.
/// Every block obtained from `acquire` has to be passed to `release` exactly once.
struct Scratch_Pool {
    virtual ~Scratch_Pool() = default;

    /// @brief Returns a block of at least `size` code units.
    /// The returned span has exactly `size` elements.
    [[nodiscard]]
    virtual std::span<char8_t> acquire(std::size_t size)
        = 0;

    /// @brief Returns `block`, previously obtained from `acquire`, to the pool.
    virtual void release(std::span<char8_t> block) noexcept = 0;
};

/// @brief A `Scratch_Pool` which obtains its blocks from a `std::pmr::memory_resource`.
struct Memory_Resource_Scratch_Pool final : Scratch_Pool {
private:
    std::pmr::memory_resource* m_memory;

public:
    [[nodiscard]]
    explicit Memory_Resource_Scratch_Pool(std::pmr::memory_resource* memory) noexcept
        : m_memory { memory }
    {
        VELLUM_ASSERT(memory);
    }

    [[nodiscard]]
    std::span<char8_t> acquire(std::size_t size) final;

    void release(std::span<char8_t> block) noexcept final;
};

/// @brief The process-wide `Scratch_Pool`,
/// backed by a `std::pmr::synchronized_pool_resource`.
struct Global_Scratch_Pool final : Scratch_Pool {
private:
    std::pmr::synchronized_pool_resource m_resource;
    Memory_Resource_Scratch_Pool m_pool { &m_resource };

    Global_Scratch_Pool() = default;

public:
    Global_Scratch_Pool(const Global_Scratch_Pool&) = delete;
    Global_Scratch_Pool& operator=(const Global_Scratch_Pool&) = delete;

    /// @brief Returns the global pool.
    /// It is created on first use and lives until the end of the process.
    [[nodiscard]]
    static Global_Scratch_Pool* get();

    [[nodiscard]]
    std::span<char8_t> acquire(std::size_t size) final
    {
        return m_pool.acquire(size);
    }

    void release(std::span<char8_t> block) noexcept final
    {
        m_pool.release(block);
    }
};

/// @brief Scoped ownership of a block acquired from a `Scratch_Pool`.
/// The block is released when the lease is destroyed,
/// unless ownership was transferred out using `take()`.
struct Scratch_Lease {
private:
    Scratch_Pool* m_pool;
    std::span<char8_t> m_block;

public:
    [[nodiscard]]
    explicit Scratch_Lease(Scratch_Pool& pool, std::size_t size)
        : m_pool { &pool }
        , m_block { pool.acquire(size) }
    {
    }

    [[nodiscard]]
    Scratch_Lease(Scratch_Lease&& other) noexcept
        : m_pool { std::exchange(other.m_pool, nullptr) }
        , m_block { std::exchange(other.m_block, {}) }
    {
    }

    Scratch_Lease& operator=(Scratch_Lease&& other) noexcept
    {
        if (this != &other) {
            reset();
            m_pool = std::exchange(other.m_pool, nullptr);
            m_block = std::exchange(other.m_block, {});
        }
        return *this;
    }

    Scratch_Lease(const Scratch_Lease&) = delete;
    Scratch_Lease& operator=(const Scratch_Lease&) = delete;

    ~Scratch_Lease()
    {
        reset();
    }

    [[nodiscard]]
    std::span<char8_t> get() const noexcept
    {
        return m_block;
    }

    /// @brief Returns `true` iff the lease still owns a block.
    [[nodiscard]]
    explicit operator bool() const noexcept
    {
        return m_pool != nullptr;
    }

    /// @brief Gives up ownership of the block without releasing it.
    /// The caller becomes responsible for releasing the result to the pool.
    [[nodiscard]]
    std::span<char8_t> take() noexcept
    {
        m_pool = nullptr;
        return std::exchange(m_block, {});
    }

    /// @brief Releases the block to its pool, if the lease still owns one.
    void reset() noexcept
    {
        if (m_pool != nullptr) {
            m_pool->release(m_block);
            m_pool = nullptr;
            m_block = {};
        }
    }
};

} // namespace vellum

#endif
