#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

// Chooses the prompt shown with a reminder; two consecutive draws never repeat when more
// than one prompt exists.
class TipSelector {
  public:
    // Returns a uniform value in [0, bound).
    using RandomSource = std::function<std::size_t(std::size_t bound)>;

    explicit TipSelector(std::size_t count = kTipCount, RandomSource random = {});

    std::size_t Next();
    std::optional<std::size_t> LastIndex() const {
        return m_LastIndex;
    }

    static std::string TipText(std::size_t index);

    static constexpr std::size_t kTipCount = 15;

  private:
    std::size_t m_Count;
    RandomSource m_Random;
    std::optional<std::size_t> m_LastIndex;
};
