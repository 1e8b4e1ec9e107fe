#include "sync/SiblingLocks.hpp"

namespace fs = std::filesystem;

using namespace ms::sync;

std::unique_lock<std::mutex> SiblingLocks::acquire(const fs::path& sibling) {
    std::error_code ec;
    auto key = fs::weakly_canonical(sibling, ec);
    if (ec) key = sibling.lexically_normal();

    std::mutex* m;
    {
        std::scoped_lock lock(mapMutex_);
        auto& slot = locks_[key];
        if (!slot) slot = std::make_unique<std::mutex>();
        m = slot.get();
    }
    return std::unique_lock(*m);
}
