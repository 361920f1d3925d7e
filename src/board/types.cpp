#include "types.hpp"

namespace mnemosyne {
namespace board {

std::string regionName(Region region) {
    switch (region) {
        case COLOR_RED: return "red";
        case COLOR_YELLOW: return "yellow";
        case COLOR_GREEN: return "green";
        case COLOR_BLUE: return "blue";
        case NO_REGION: return "none";
        default: return "region " + std::to_string(region);
    }
}

} // namespace board
} // namespace mnemosyne
