#pragma once
#include "basis.hpp"
#include <memory>
#include <string>
#include <utility>

namespace tnua {

// ---------------------------------------------------------------------------
// Controller: per-character component holding the active basis.
//
// Gameplay code calls basis() every frame with fresh parameters. When the
// requested type matches the stored one, only the name and configuration are
// replaced and the running state (timers, smoothed velocities) carries over.
// A different type drops the old basis and starts from a default State.
//
// The name is for diagnostics and the debug panel; dispatch never uses it.
// Driven by BasisSystem in the Logic stage.
// ---------------------------------------------------------------------------

class Controller {
public:
    template<typename B>
    Controller& basis(std::string name, B basis) {
        if (auto* existing = dynamic_cast<BoxableBasis<B>*>(current_basis_.get())) {
            existing->input = std::move(basis);
        } else {
            current_basis_ = std::make_unique<BoxableBasis<B>>(std::move(basis));
        }
        basis_name_ = std::move(name);
        return *this;
    }

    bool has_basis() const { return current_basis_ != nullptr; }

    // Empty when no basis has been set.
    const std::string& basis_name() const { return basis_name_; }

    DynamicBasis*       dynamic_basis()       { return current_basis_.get(); }
    const DynamicBasis* dynamic_basis() const { return current_basis_.get(); }

    // Stored configuration, or nullptr if the slot holds something else.
    template<typename B>
    const B* concrete_basis() const {
        auto* boxed = dynamic_cast<const BoxableBasis<B>*>(current_basis_.get());
        return boxed ? &boxed->input : nullptr;
    }

    template<typename B>
    const typename B::State* basis_state() const {
        auto* boxed = dynamic_cast<const BoxableBasis<B>*>(current_basis_.get());
        return boxed ? &boxed->state : nullptr;
    }

private:
    std::string                   basis_name_;
    std::unique_ptr<DynamicBasis> current_basis_;
};

} // namespace tnua
