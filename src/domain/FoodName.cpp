#include "domain/FoodName.hpp"
#include <cctype>

namespace glycemicguard::domain {

std::string NormalizeFoodName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    bool pendingSpace = false;
    for (char ch : name) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

} // namespace glycemicguard::domain
