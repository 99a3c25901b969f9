#pragma once

#include <stdexcept>

#include <cstddef>

namespace wirepack {

/**
 * @brief Bounds applied by unpack() to untrusted input
 *
 * Passed explicitly into every unpack call, so independent callers can use
 * independent limits without sharing mutable state. Reading a limits object
 * concurrently is safe; mutating one while it is in use is the caller's hazard.
 *
 * Example:
 * @code
 *   wirepack::SecurityLimits limits;
 *   limits.set_max_buffer_size(1500);
 *   limits.set_max_nesting_depth(4);
 *   auto result = wirepack::unpack<IcmpPacket>(datagram, limits);
 * @endcode
 */
class SecurityLimits {
public:
    static constexpr std::size_t default_max_buffer_size = 10 * 1024 * 1024; ///< 10 MiB
    static constexpr std::size_t default_max_nesting_depth = 100;

    constexpr SecurityLimits() noexcept = default;

    /**
     * @brief Construct with explicit limits
     * @throws std::invalid_argument if either limit is zero
     */
    SecurityLimits(std::size_t max_buffer_size, std::size_t max_nesting_depth) {
        set_max_buffer_size(max_buffer_size);
        set_max_nesting_depth(max_nesting_depth);
    }

    /// Upper bound on the total input length accepted by unpack()
    [[nodiscard]] constexpr std::size_t max_buffer_size() const noexcept {
        return max_buffer_size_;
    }

    /// Upper bound on nested-record recursion depth during unpack()
    [[nodiscard]] constexpr std::size_t max_nesting_depth() const noexcept {
        return max_nesting_depth_;
    }

    /**
     * @brief Set the maximum accepted input length in bytes
     * @throws std::invalid_argument if size is zero
     */
    void set_max_buffer_size(std::size_t size) {
        if (size == 0) {
            throw std::invalid_argument("max buffer size must be positive");
        }
        max_buffer_size_ = size;
    }

    /**
     * @brief Set the maximum nested-record depth
     * @throws std::invalid_argument if depth is zero
     */
    void set_max_nesting_depth(std::size_t depth) {
        if (depth == 0) {
            throw std::invalid_argument("max nesting depth must be positive");
        }
        max_nesting_depth_ = depth;
    }

    /// Restore both limits to their defaults
    constexpr void reset() noexcept {
        max_buffer_size_ = default_max_buffer_size;
        max_nesting_depth_ = default_max_nesting_depth;
    }

    constexpr bool operator==(const SecurityLimits&) const noexcept = default;

private:
    std::size_t max_buffer_size_{default_max_buffer_size};
    std::size_t max_nesting_depth_{default_max_nesting_depth};
};

} // namespace wirepack
