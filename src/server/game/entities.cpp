// SPDX-License-Identifier: Apache-2.0
#include "server/game/entities.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace arena::game {

TimeMs steady_now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

void Player::expire_buffs(TimeMs now)
{
    buffs.erase(
        std::remove_if(buffs.begin(), buffs.end(), [now](const ActiveBuff &b) { return b.until <= now; }),
        buffs.end());
}

float Player::speed_multiplier() const
{
    float m = 1.f;
    for (const auto &b : buffs)
        if (b.stat == BuffStat::speed)
            m *= b.multiplier;
    return m;
}

float Player::damage_multiplier() const
{
    float m = damage_mul * class_damage_mul;
    for (const auto &b : buffs)
        if (b.stat == BuffStat::damage)
            m *= b.multiplier;
    return m;
}

void Player::apply_buff(const BuffSpec &spec, TimeMs now)
{
    auto duration = static_cast<TimeMs>(std::lround(static_cast<float>(spec.duration_ms) * buff_duration_mul));
    buffs.push_back(ActiveBuff{spec.stat, spec.multiplier, now + duration});
}

b2Vec2 sanitize_input(float x, float y)
{
    if (!std::isfinite(x) || !std::isfinite(y))
        return b2Vec2{0.f, 0.f};
    b2Vec2 v{std::clamp(x, -1.f, 1.f), std::clamp(y, -1.f, 1.f)};
    float len = b2Length(v);
    if (len <= 1e-6f)
        return b2Vec2{0.f, 0.f};
    if (len > 1.f)
        v = b2MulSV(1.f / len, v);
    return v;
}

void Mob::record_damage(const std::string &attacker_id, float amount, TimeMs now, uint64_t seq)
{
    auto it = std::find_if(
        ledger.begin(), ledger.end(), [&](const DamageShare &d) { return d.attacker_id == attacker_id; });
    if (it != ledger.end()) {
        it->amount += amount;
        return;
    }
    ledger.push_back(DamageShare{attacker_id, amount, now, seq});
}

} // namespace arena::game
