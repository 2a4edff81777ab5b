#ifndef TIME_SOURCE_HPP
#define TIME_SOURCE_HPP

#include <map>
#include <optional>
#include <string>

/**
 * @brief Game speed control. Stored in the registry context.
 *
 * Speed is one of 1, 4, 8, 16 or 32. When players vote, the slowest
 * vote wins; with no votes the speed falls back to 1x. Paused time has
 * a multiplier of 0.
 */
class TimeSource {
public:
    static bool IsSupportedSpeed(int speed);

    // 0 when paused
    double CurrentSpeedMultiplier() const;

    int RawSpeed() const { return m_speed; }
    bool IsPaused() const { return m_paused; }

    // Returns false for an unsupported speed.
    bool SetTimeSpeed(int speed);
    void SetPaused(bool paused);
    void TogglePause() { SetPaused(!m_paused); }

    bool Vote(const std::string& player_id, int speed);
    void ClearVote(const std::string& player_id);

    // Drop to 1x while a train approaches a station, then restore.
    void StoreSpeedAndSetNormal();
    void RestorePreviousSpeed();

    /**
     * @brief Advances game time by one tick.
     * @return The scaled delta for this tick.
     */
    double Advance(double real_dt);
    double GameTime() const { return m_game_time; }

private:
    void RecalculateSpeed();

    int m_speed = 1;
    bool m_paused = false;
    std::optional<int> m_previous_speed;
    std::map<std::string, int> m_votes;
    double m_game_time = 0.0;
};


#endif // TIME_SOURCE_HPP
