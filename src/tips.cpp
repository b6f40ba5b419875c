#include "tips.hpp"

#include <algorithm>
#include <memory>
#include <random>
#include <utility>

namespace {

const char *const kTips[TipSelector::kTipCount] = {
    "Smelly butt, smelly butt, please stand up!",
    "Your chakras are literally flattening. Stand up!",
    "The chair is NOT your lobster. Move!",
    "My spirit says your butt needs freedom!",
    "Could you BE sitting any longer?",
    "Could your butt BE any flatter? Stand!",
    "Could this chair BE more attached to you?",
    "So, I'm just gonna DIE here sitting?",
    "Could sitting here BE any sadder? Move!",
    "Your posture is a MESS. Stand up.",
    "If you won't move, I'll MAKE you move!",
    "How YOU sittin'? Get up already!",
    "Stand up or your sandwich gets it!",
    "Oh. My. God. You're STILL sitting?!",
    "Nooo, you can't sit forever. It's like... so bad!",
};

// ─────────────────────────────────────
TipSelector::RandomSource MakeDefaultRandom() {
    auto engine = std::make_shared<std::mt19937>(std::random_device{}());
    return [engine](std::size_t bound) -> std::size_t {
        std::uniform_int_distribution<std::size_t> dist(0, bound - 1);
        return dist(*engine);
    };
}

} // namespace

// ─────────────────────────────────────
TipSelector::TipSelector(std::size_t count, RandomSource random)
    : m_Count(std::max<std::size_t>(count, 1)),
      m_Random(random ? std::move(random) : MakeDefaultRandom()) {}

// ─────────────────────────────────────
std::size_t TipSelector::Next() {
    std::size_t idx = m_Random(m_Count) % m_Count;
    if (m_LastIndex && m_Count > 1 && idx == *m_LastIndex) {
        // Shift by 1..count-1 so the previous index is the one value never reached.
        idx = (idx + 1 + m_Random(m_Count - 1) % (m_Count - 1)) % m_Count;
    }
    m_LastIndex = idx;
    return idx;
}

// ─────────────────────────────────────
std::string TipSelector::TipText(std::size_t index) {
    return kTips[index % kTipCount];
}
