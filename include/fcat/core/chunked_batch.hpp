#pragma once

#include "fcat/core/result.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace fcat::core {

/**
 * @brief Splits a list into slices of at most N items
 *
 * Used wherever an id list is bound into a single SQL statement, since
 * SQLite caps the number of host parameters per statement.
 *
 * EXAMPLE:
 * ChunkedBatch<std::string> batch(ids, 900);
 * auto result = batch.for_each([&](const std::vector<std::string>& chunk) {
 *     return store.soft_delete(chunk, now);
 * });
 */
template<typename T>
class ChunkedBatch {
public:
    ChunkedBatch(const std::vector<T>& items, std::size_t chunk_size)
        : items_(items), chunk_size_(std::max<std::size_t>(chunk_size, 1)) {}

    std::size_t chunk_count() const noexcept {
        return (items_.size() + chunk_size_ - 1) / chunk_size_;
    }

    /**
     * @brief Run fn on every slice in order, stopping at the first error
     *
     * fn signature: Result<void>(const std::vector<T>& chunk)
     */
    template<typename Fn>
    Result<void> for_each(Fn&& fn) const {
        std::vector<T> chunk;
        chunk.reserve(std::min(chunk_size_, items_.size()));

        for (std::size_t offset = 0; offset < items_.size(); offset += chunk_size_) {
            const auto end = std::min(offset + chunk_size_, items_.size());
            chunk.assign(items_.begin() + static_cast<std::ptrdiff_t>(offset),
                         items_.begin() + static_cast<std::ptrdiff_t>(end));

            auto result = fn(chunk);
            if (result.is_error()) {
                return result;
            }
        }
        return Ok();
    }

private:
    const std::vector<T>& items_;
    std::size_t chunk_size_;
};

} // namespace fcat::core
