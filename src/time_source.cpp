#include "time_source.hpp"

#include <algorithm>
#include <iostream>

bool TimeSource::IsSupportedSpeed(int speed) {
    return speed == 1 || speed == 4 || speed == 8 || speed == 16 || speed == 32;
}

double TimeSource::CurrentSpeedMultiplier() const {
    return m_paused ? 0.0 : static_cast<double>(m_speed);
}

bool TimeSource::SetTimeSpeed(int speed) {
    if (!IsSupportedSpeed(speed)) {
        std::cerr << "Warning: Unsupported time speed " << speed << "x ignored." << std::endl;
        return false;
    }
    m_speed = speed;
    return true;
}

void TimeSource::SetPaused(bool paused) {
    m_paused = paused;
}

bool TimeSource::Vote(const std::string& player_id, int speed) {
    if (!IsSupportedSpeed(speed)) {
        std::cerr << "Warning: Player '" << player_id << "' voted for unsupported speed "
                  << speed << "x." << std::endl;
        return false;
    }
    m_votes[player_id] = speed;
    RecalculateSpeed();
    return true;
}

void TimeSource::ClearVote(const std::string& player_id) {
    m_votes.erase(player_id);
    RecalculateSpeed();
}

void TimeSource::StoreSpeedAndSetNormal() {
    if (m_speed != 1) {
        m_previous_speed = m_speed;
        m_speed = 1;
    }
}

void TimeSource::RestorePreviousSpeed() {
    if (m_previous_speed && m_speed == 1) {
        m_speed = *m_previous_speed;
    }
    m_previous_speed.reset();
}

double TimeSource::Advance(double real_dt) {
    const double scaled_dt = real_dt * CurrentSpeedMultiplier();
    m_game_time += scaled_dt;
    return scaled_dt;
}

void TimeSource::RecalculateSpeed() {
    if (m_votes.empty()) {
        m_speed = 1;
        return;
    }
    int slowest = m_votes.begin()->second;
    for (const auto& [player, speed] : m_votes) {
        slowest = std::min(slowest, speed);
    }
    m_speed = slowest;
}
