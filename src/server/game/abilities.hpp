// SPDX-License-Identifier: Apache-2.0
// abilities.hpp - cast validation and skill effect dispatch
#pragma once
#include "server/game/world.hpp"

#include <box2d/math_functions.h>

#include <cstdint>
#include <optional>
#include <string>

namespace arena::game {

struct CastRequest
{
    // 1-based; out-of-range values are clamped into [1, kSkillSlots]
    uint32_t slot{1};
    std::string class_hint;
    std::optional<std::string> target_id;
    // Radians, 0 = +x
    std::optional<float> angle;
    std::optional<b2Vec2> aim;
};

struct CastResult
{
    bool accepted{false};
    std::string reason; // empty when accepted
};

uint32_t clamp_slot(uint32_t slot);

// Validates (alive, not stunned, cooldown, target) and resolves the skill in the calling tick.
// Rejections are sent to the caster as cast_rejected; accepted casts always broadcast cast_effect.
CastResult cast_skill(World &world, Player &caster, const CastRequest &req, TimeMs now);

} // namespace arena::game
