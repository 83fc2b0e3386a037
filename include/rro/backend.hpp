#pragma once

#include "rro/types.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace rro {

// ============================================================================
// Backend
// ============================================================================

// Installs and manages overlays through one platform integration
class Backend {
public:
    virtual ~Backend() = default;

    virtual BackendKind kind() const = 0;

    const char* name() const { return backend_kind_to_string(kind()); }
};

// Backend carrying only its kind; integrations are provided by the embedder
class StrategyBackend : public Backend {
public:
    explicit StrategyBackend(BackendKind kind) : kind_(kind) {}

    BackendKind kind() const override { return kind_; }

private:
    BackendKind kind_;
};

using BackendFactory = std::function<std::shared_ptr<Backend>(BackendKind)>;

// Factory producing StrategyBackend instances
BackendFactory default_backend_factory();

// ============================================================================
// Backend Slot
// ============================================================================

/**
 * Set-once holder for the selected backend. Once a backend is stored it is
 * never replaced. Selection runs under the slot lock so at most one backend
 * is ever instantiated.
 */
class BackendSlot {
public:
    std::shared_ptr<Backend> get() const;

    bool has_backend() const { return get() != nullptr; }

    // Returns true when a backend is held afterwards. `select` is only called
    // while the slot is empty; a null result leaves it empty.
    bool set_once(const std::function<std::shared_ptr<Backend>()>& select);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<Backend> backend_;
};

// The slot shared by the whole process
BackendSlot& process_backend_slot();

} // namespace rro
