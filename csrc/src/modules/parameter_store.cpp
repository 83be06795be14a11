// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "parameter_store.h"

#include <stdexcept>

#include <fmt/core.h>

#include "utilities/utils.h"

namespace modules {

int ParameterStore::add(const std::string& name, const std::vector<long>& shape, bool trainable) {
    if (mNames.contains(name)) {
        throw std::logic_error(fmt::format("Parameter '{}' registered twice", name));
    }
    int slot = num_slots();
    Parameter& p = mSlots.emplace_back();
    p.Name = name;
    p.Value = Tensor::zeros(shape);
    p.Grad = Tensor::zeros(shape);
    p.Trainable = trainable;
    mNames.emplace(name, slot);
    return slot;
}

/**
 * @brief Turn @p alias into a view of the parameter that owns @p target.
 *
 * The alias slot releases its own storage. Aliases of the alias are re-pointed as
 * well, so that ownership chains are always one level deep.
 *
 * @throws config_error If the shapes of the two parameters differ.
 */
void ParameterStore::tie(int alias, int target) {
    int owner = resolve(target);
    int current = resolve(alias);
    if (owner == current) return;

    const Tensor& a = mSlots.at(current).Value;
    const Tensor& b = mSlots.at(owner).Value;
    if (!a.same_shape(b)) {
        throw config_error(fmt::format("Cannot share '{}' {} with '{}' {}: dimensions differ",
                                       mSlots.at(alias).Name, shape_to_str(a),
                                       mSlots.at(owner).Name, shape_to_str(b)));
    }

    for (auto& slot : mSlots) {
        if (slot.Owner == current) slot.Owner = owner;
    }
    Parameter& p = mSlots.at(current);
    p.Owner = owner;
    p.Value = Tensor{};
    p.Grad = Tensor{};
}

std::optional<int> ParameterStore::find(const std::string& name) const {
    auto it = mNames.find(name);
    if (it == mNames.end()) return std::nullopt;
    return it->second;
}

int ParameterStore::index_of(const std::string& name) const {
    auto it = mNames.find(name);
    if (it == mNames.end()) {
        throw std::out_of_range(fmt::format("Unknown parameter '{}'", name));
    }
    return it->second;
}

int ParameterStore::resolve(int slot) const {
    int owner = mSlots.at(slot).Owner;
    return owner < 0 ? slot : owner;
}

std::vector<int> ParameterStore::parameters() const {
    std::vector<int> result;
    for (int i = 0; i < num_slots(); ++i) {
        if (mSlots[i].Owner < 0) result.push_back(i);
    }
    return result;
}

std::vector<int> ParameterStore::trainable_parameters() const {
    std::vector<int> result;
    for (int i = 0; i < num_slots(); ++i) {
        if (mSlots[i].Owner < 0 && mSlots[i].Trainable) result.push_back(i);
    }
    return result;
}

std::vector<std::pair<std::string, int>> ParameterStore::named_slots() const {
    std::vector<std::pair<std::string, int>> result;
    result.reserve(mSlots.size());
    for (int i = 0; i < num_slots(); ++i) {
        result.emplace_back(mSlots[i].Name, i);
    }
    return result;
}

void ParameterStore::zero_grad() {
    for (auto& p : mSlots) {
        if (p.Owner < 0) p.Grad.fill(0.f);
    }
}

} // namespace modules
