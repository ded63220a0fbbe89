#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace treecp::core {

/// Размер чанка: round(count / workers), половина округляется вверх.
/// 0 означает "один чанк на весь список" (workers <= 0 или count < workers / 2).
[[nodiscard]] auto chunk_size_for(std::size_t count, std::int64_t workers) -> std::size_t;

/// Делит список на непрерывные чанки-представления, сохраняя порядок.
/// Чанков получается ceil(count / chunk_size), что может отличаться от
/// workers на единицу-две при неровном делении. Пустой список даёт 0 чанков.
/// Чанки ссылаются на items и не должны его пережить.
template<typename T>
[[nodiscard]] auto partition(std::span<const T> items, std::int64_t workers)
    -> std::vector<std::span<const T>>
{
    std::vector<std::span<const T>> chunks;
    if (items.empty()) {
        return chunks;
    }

    std::size_t size = chunk_size_for(items.size(), workers);
    if (size == 0) {
        size = items.size();
    }

    chunks.reserve((items.size() + size - 1) / size);
    for (std::size_t offset = 0; offset < items.size(); offset += size) {
        chunks.push_back(items.subspan(offset, std::min(size, items.size() - offset)));
    }
    return chunks;
}

template<typename T>
[[nodiscard]] auto partition(const std::vector<T>& items, std::int64_t workers)
    -> std::vector<std::span<const T>>
{
    return partition(std::span<const T>(items), workers);
}

} // namespace treecp::core
