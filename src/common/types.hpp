#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <string>

namespace kott {

using PlayerId = std::string;
using GameId = std::string;

// ============================================
// Team - The two sides of the table
// ============================================
enum class Team : uint8_t {
    RED,
    BLUE
};

inline Team opponentOf(Team team) {
    return team == Team::RED ? Team::BLUE : Team::RED;
}

// ============================================
// Helper Functions
// ============================================
inline const char* teamToString(Team team) {
    switch (team) {
        case Team::RED:  return "red";
        case Team::BLUE: return "blue";
        default: return "unknown";
    }
}

inline std::string trimCopy(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace kott

#endif // TYPES_HPP
