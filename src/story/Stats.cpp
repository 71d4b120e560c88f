#include "story/Stats.h"

namespace lore::story {

const char* StatName(Stat s) noexcept
{
    switch (s)
    {
    case Stat::Health:         return "health";
    case Stat::Power:          return "power";
    case Stat::Morality:       return "morality";
    case Stat::Notoriety:      return "notoriety";
    case Stat::TrustDemonLord: return "trust_demon_lord";
    case Stat::BondDemonLord:  return "bond_demon_lord";
    }
    return "?";
}

int& StatRef(StoryState& st, Stat s) noexcept
{
    switch (s)
    {
    case Stat::Health:         return st.health;
    case Stat::Power:          return st.power;
    case Stat::Morality:       return st.morality;
    case Stat::Notoriety:      return st.notoriety;
    case Stat::TrustDemonLord: return st.trustDemonLord;
    case Stat::BondDemonLord:  return st.bondDemonLord;
    }
    return st.health;
}

int StatValue(const StoryState& st, Stat s) noexcept
{
    switch (s)
    {
    case Stat::Health:         return st.health;
    case Stat::Power:          return st.power;
    case Stat::Morality:       return st.morality;
    case Stat::Notoriety:      return st.notoriety;
    case Stat::TrustDemonLord: return st.trustDemonLord;
    case Stat::BondDemonLord:  return st.bondDemonLord;
    }
    return st.health;
}

int ApplyStatDelta(StoryState& st, Stat s, int delta) noexcept
{
    int& v = StatRef(st, s);
    const int before = v;
    const StatRange r = RangeOf(s);
    v = Clamp(before + delta, r.lo, r.hi);
    return v - before;
}

void ClampAllStats(StoryState& st) noexcept
{
    for (int i = 0; i < kStatCount; ++i)
    {
        const Stat s = static_cast<Stat>(i);
        int& v = StatRef(st, s);
        const StatRange r = RangeOf(s);
        v = Clamp(v, r.lo, r.hi);
    }
}

} // namespace lore::story
