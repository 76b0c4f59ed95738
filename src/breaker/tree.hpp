#pragma once

/**
 * FUSE Breaker Tree
 * Owns the master switch and every panel; circuits live inside their panel.
 *
 * The circuit -> panel relation is a non-owning id index, so there is no
 * back-pointer from a circuit to its panel.
 *
 * Pointers returned by the find functions are valid only until the next
 * insert or clear(). Code that gives up the registry lock (probe) must
 * look nodes up again by id afterwards.
 */

#include <algorithm>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace fuse {
namespace breaker {

class BreakerTree {
public:
    MasterSwitch& master() noexcept { return master_; }
    const MasterSwitch& master() const noexcept { return master_; }

    std::vector<Panel>& panels() noexcept { return panels_; }
    const std::vector<Panel>& panels() const noexcept { return panels_; }

    // ========================================================================
    // Lookup
    // ========================================================================

    Panel* find_panel(const std::string& panel_id) noexcept {
        for (Panel& p : panels_) {
            if (p.id() == panel_id) return &p;
        }
        return nullptr;
    }

    const Panel* find_panel(const std::string& panel_id) const noexcept {
        return const_cast<BreakerTree*>(this)->find_panel(panel_id);
    }

    Panel* panel_for(const std::string& circuit_id) noexcept {
        auto it = owner_.find(circuit_id);
        return it == owner_.end() ? nullptr : find_panel(it->second);
    }

    const Panel* panel_for(const std::string& circuit_id) const noexcept {
        return const_cast<BreakerTree*>(this)->panel_for(circuit_id);
    }

    Circuit* find_circuit(const std::string& circuit_id) noexcept {
        Panel* panel = panel_for(circuit_id);
        if (panel == nullptr) return nullptr;
        for (Circuit& c : panel->circuits) {
            if (c.id() == circuit_id) return &c;
        }
        return nullptr;
    }

    const Circuit* find_circuit(const std::string& circuit_id) const noexcept {
        return const_cast<BreakerTree*>(this)->find_circuit(circuit_id);
    }

    bool contains_circuit(const std::string& circuit_id) const {
        return owner_.count(circuit_id) > 0;
    }

    /**
     * Panel ids in display order (stable copy for cascades)
     */
    std::vector<std::string> panel_ids() const {
        std::vector<std::string> ids;
        ids.reserve(panels_.size());
        for (const Panel& p : panels_) ids.push_back(p.id());
        return ids;
    }

    /**
     * Circuit ids of one panel in registration order
     */
    std::vector<std::string> circuit_ids(const std::string& panel_id) const {
        std::vector<std::string> ids;
        if (const Panel* panel = find_panel(panel_id)) {
            ids.reserve(panel->circuits.size());
            for (const Circuit& c : panel->circuits) ids.push_back(c.id());
        }
        return ids;
    }

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * Insert keeping panels ordered by position (ties keep insertion order)
     */
    Panel& insert_panel(Panel panel) {
        if (panel.descriptor.position == 0) {
            panel.descriptor.position = static_cast<uint32_t>(panels_.size() + 1);
        }
        auto pos = std::upper_bound(
            panels_.begin(), panels_.end(), panel.descriptor.position,
            [](uint32_t position, const Panel& p) { return position < p.descriptor.position; });
        return *panels_.insert(pos, std::move(panel));
    }

    Circuit& insert_circuit(Panel& panel, Circuit circuit) {
        circuit.panel_id = panel.id();
        owner_[circuit.id()] = panel.id();
        panel.circuits.push_back(std::move(circuit));
        return panel.circuits.back();
    }

    /**
     * Drop every node and return the master to its initial state
     */
    void clear() {
        panels_.clear();
        owner_.clear();
        master_ = MasterSwitch{};
        generation_++;
    }

    /**
     * Bumped by clear(); lets a cascade notice the tree was replaced under it
     */
    uint64_t generation() const noexcept { return generation_; }

private:
    MasterSwitch master_;
    std::vector<Panel> panels_;
    std::unordered_map<std::string, std::string> owner_;   // circuit id -> panel id
    uint64_t generation_{0};
};

} // namespace breaker
} // namespace fuse
