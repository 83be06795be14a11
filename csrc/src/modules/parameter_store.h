// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef NMTCORE_SRC_MODULES_PARAMETER_STORE_H
#define NMTCORE_SRC_MODULES_PARAMETER_STORE_H

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "utilities/tensor.h"

namespace modules {

/**
 * @brief One registered parameter slot.
 *
 * A slot either owns its tensors (Owner < 0) or is an alias of another slot after
 * tie(); aliases carry no data and every access is forwarded to the owner.
 */
struct Parameter {
    std::string Name;
    Tensor Value;
    Tensor Grad;
    bool Trainable = true;
    int Owner = -1;
};

/**
 * @brief Flat registry of all parameters of a model.
 *
 * Modules register their parameters once at construction and keep the returned slot
 * index. Sharing a weight between modules is expressed by tie(), which turns a slot
 * into an alias of another one: the shared tensor then exists exactly once, gets
 * one gradient and one optimizer state, while both names stay addressable for
 * state-dict purposes.
 */
class ParameterStore {
public:
    //! Register a zero-initialised parameter; names must be unique.
    int add(const std::string& name, const std::vector<long>& shape, bool trainable = true);

    /**
     * @brief Make slot @p alias resolve to the parameter owning slot @p target.
     *
     * @throws config_error If the two parameters disagree in shape.
     */
    void tie(int alias, int target);

    //! Slot index of @p name, std::nullopt when unknown.
    [[nodiscard]] std::optional<int> find(const std::string& name) const;
    //! Slot index of @p name; throws std::out_of_range when unknown.
    [[nodiscard]] int index_of(const std::string& name) const;

    //! Owning slot of @p slot (itself unless aliased).
    [[nodiscard]] int resolve(int slot) const;
    [[nodiscard]] bool is_alias(int slot) const { return mSlots.at(slot).Owner >= 0; }

    Parameter& at(int slot) { return mSlots.at(resolve(slot)); }
    [[nodiscard]] const Parameter& at(int slot) const { return mSlots.at(resolve(slot)); }

    Tensor& value(int slot) { return at(slot).Value; }
    [[nodiscard]] const Tensor& value(int slot) const { return at(slot).Value; }
    Tensor& grad(int slot) { return at(slot).Grad; }

    //! Name under which @p slot was registered (aliases keep their own name).
    [[nodiscard]] const std::string& name(int slot) const { return mSlots.at(slot).Name; }

    //! Owning slots in registration order. Each shared tensor appears once.
    [[nodiscard]] std::vector<int> parameters() const;
    //! Owning, trainable slots.
    [[nodiscard]] std::vector<int> trainable_parameters() const;

    //! Every registered name with its slot, aliases included, in registration order.
    [[nodiscard]] std::vector<std::pair<std::string, int>> named_slots() const;

    [[nodiscard]] int num_slots() const { return static_cast<int>(mSlots.size()); }

    void set_trainable(int slot, bool trainable) { at(slot).Trainable = trainable; }
    void zero_grad();

private:
    std::vector<Parameter> mSlots;
    std::unordered_map<std::string, int> mNames;
};

} // namespace modules

#endif //NMTCORE_SRC_MODULES_PARAMETER_STORE_H
