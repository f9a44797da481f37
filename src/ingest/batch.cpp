#include "ingest/batch.hpp"

std::size_t Batch::trim_oldest(std::size_t limit)
{
    if (vec_.size() <= limit) return 0;
    auto excess = vec_.size() - limit;
    vec_.erase(vec_.begin(), vec_.begin() + static_cast<std::ptrdiff_t>(excess));
    return excess;
}
