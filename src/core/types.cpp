#include "core/types.h"
#include <algorithm>
#include <cctype>

namespace coursedao {
namespace core {

const char* roleToString(Role role) {
    switch (role) {
        case Role::NONE: return "NONE";
        case Role::BOARD: return "BOARD";
        case Role::TEACHER: return "TEACHER";
        case Role::STUDENT: return "STUDENT";
        default: return "UNKNOWN";
    }
}

bool roleFromString(const std::string& name, Role& out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (s == "NONE") out = Role::NONE;
    else if (s == "BOARD") out = Role::BOARD;
    else if (s == "TEACHER") out = Role::TEACHER;
    else if (s == "STUDENT") out = Role::STUDENT;
    else return false;
    return true;
}

Amount mulDivFloor(Amount a, uint64_t b, uint64_t d) {
    unsigned __int128 product = static_cast<unsigned __int128>(a) * b;
    return static_cast<Amount>(product / d);
}

}
}
