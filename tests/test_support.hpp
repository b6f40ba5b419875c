#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "clock.hpp"
#include "reminder.hpp"

namespace testing_support {

// Unix seconds of a UTC civil time.
inline std::int64_t UtcEpoch(int y, unsigned m, unsigned d, int hh = 0, int mm = 0, int ss = 0) {
    using namespace std::chrono;
    const sys_days date{year{y} / month{m} / day{d}};
    return duration_cast<seconds>(date.time_since_epoch()).count() + hh * 3600 + mm * 60 + ss;
}

class FakeClock : public Clock {
  public:
    explicit FakeClock(std::int64_t now) : m_Now(now) {}

    std::int64_t Now() const override {
        return m_Now;
    }
    std::chrono::steady_clock::time_point SteadyNow() const override {
        return m_Steady;
    }

    void Advance(std::int64_t secs) {
        m_Now += secs;
        m_Steady += std::chrono::seconds(secs);
    }
    void AdvanceMs(std::int64_t ms) {
        m_Steady += std::chrono::milliseconds(ms);
    }

  private:
    std::int64_t m_Now;
    std::chrono::steady_clock::time_point m_Steady{std::chrono::hours(1000)};
};

// Zone with a constant UTC offset and no transitions.
class FixedOffsetZone : public TimeZone {
  public:
    explicit FixedOffsetZone(std::int64_t offsetSecs = 0) : m_Offset(offsetSecs) {}

    bool ToLocal(std::int64_t ts, LocalDateTime &out) const override {
        using namespace std::chrono;
        const seconds local{ts + m_Offset};
        const sys_days date = floor<days>(sys_seconds{local});
        const year_month_day ymd{date};
        const hh_mm_ss<seconds> hms{local - date.time_since_epoch()};
        out.year = static_cast<int>(ymd.year());
        out.month = static_cast<unsigned>(ymd.month());
        out.day = static_cast<unsigned>(ymd.day());
        out.hour = static_cast<int>(hms.hours().count());
        out.minute = static_cast<int>(hms.minutes().count());
        out.second = static_cast<int>(hms.seconds().count());
        return true;
    }

    LocalResolution FromLocal(const LocalDateTime &local) const override {
        LocalResolution res;
        const std::int64_t ts = UtcEpoch(local.year, local.month, local.day, local.hour,
                                         local.minute, local.second) -
                                m_Offset;
        res.single = ts;
        res.earliest = ts;
        res.latest = ts;
        return res;
    }

  private:
    std::int64_t m_Offset;
};

// Every local midnight falls into a gap.
class GapAtMidnightZone : public FixedOffsetZone {
  public:
    LocalResolution FromLocal(const LocalDateTime &local) const override {
        if (local.hour == 0 && local.minute == 0 && local.second == 0) {
            return {};
        }
        return FixedOffsetZone::FromLocal(local);
    }
};

class FakePresenter : public ReminderPresenter {
  public:
    bool Available() override {
        return available;
    }
    PromptStatus Status() override {
        return status;
    }
    std::optional<WorkArea> PrimaryWorkArea() override {
        return workArea;
    }
    void Show(const ReminderPrompt &prompt) override {
        shown.push_back(prompt);
        status = PROMPT_VISIBLE;
    }
    void Hide() override {
        hides++;
        status = PROMPT_MISSING;
    }

    bool available = true;
    PromptStatus status = PROMPT_MISSING;
    std::optional<WorkArea> workArea;
    std::vector<ReminderPrompt> shown;
    int hides = 0;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
  public:
    TempDir() {
        std::random_device rd;
        const auto base = std::filesystem::temp_directory_path();
        do {
            m_Path = base / ("upstand_tests_" + std::to_string(rd()));
        } while (std::filesystem::exists(m_Path));
        std::filesystem::create_directories(m_Path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_Path, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &Path() const {
        return m_Path;
    }

  private:
    std::filesystem::path m_Path;
};

inline void WriteFile(const std::filesystem::path &path, const std::string &body) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << body;
}

inline std::string ReadFile(const std::filesystem::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace testing_support
