#include "partitioner.hpp"
#include <cmath>

namespace treecp::core {

auto chunk_size_for(std::size_t count, std::int64_t workers) -> std::size_t {
    if (workers <= 0) {
        return 0;
    }
    const double exact = static_cast<double>(count) / static_cast<double>(workers);
    return static_cast<std::size_t>(std::llround(exact));
}

} // namespace treecp::core
