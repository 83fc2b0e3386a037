#include "rro/backend.hpp"

namespace rro {

BackendFactory default_backend_factory() {
    return [](BackendKind kind) -> std::shared_ptr<Backend> {
        return std::make_shared<StrategyBackend>(kind);
    };
}

std::shared_ptr<Backend> BackendSlot::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_;
}

bool BackendSlot::set_once(const std::function<std::shared_ptr<Backend>()>& select) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (backend_) return true;

    auto selected = select();
    if (!selected) return false;

    backend_ = std::move(selected);
    return true;
}

BackendSlot& process_backend_slot() {
    static BackendSlot slot;
    return slot;
}

} // namespace rro
