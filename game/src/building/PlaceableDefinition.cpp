#include "building/PlaceableDefinition.hpp"

#include <stdexcept>

namespace Lodestone {
namespace Building {

float GetOverlapScale(OverlapModifier modifier) {
    int value = static_cast<int>(modifier);
    if (value == 0) {
        value = static_cast<int>(OverlapModifier::None);
    }
    if (value <= MaxOverlapModifier) {
        return 1.0f / static_cast<float>(value);
    }
    return static_cast<float>(value) / static_cast<float>(MaxOverlapModifier);
}

const char* OverlapModifierToString(OverlapModifier modifier) {
    switch (modifier) {
        case OverlapModifier::Undefined:     return "undefined";
        case OverlapModifier::None:          return "none";
        case OverlapModifier::Half:          return "half";
        case OverlapModifier::Quarter:       return "quarter";
        case OverlapModifier::Eighth:        return "eighth";
        case OverlapModifier::Sixteenth:     return "sixteenth";
        case OverlapModifier::PlusSixteenth: return "plus_sixteenth";
        case OverlapModifier::PlusEighth:    return "plus_eighth";
        case OverlapModifier::PlusQuarter:   return "plus_quarter";
        case OverlapModifier::PlusHalf:      return "plus_half";
        case OverlapModifier::Double:        return "double";
        case OverlapModifier::Triple:        return "triple";
        case OverlapModifier::Quadruple:     return "quadruple";
        default:                             return "unknown";
    }
}

OverlapModifier OverlapModifierFromString(const std::string& name) {
    static const OverlapModifier kAll[] = {
        OverlapModifier::Undefined, OverlapModifier::None, OverlapModifier::Half,
        OverlapModifier::Quarter, OverlapModifier::Eighth, OverlapModifier::Sixteenth,
        OverlapModifier::PlusSixteenth, OverlapModifier::PlusEighth, OverlapModifier::PlusQuarter,
        OverlapModifier::PlusHalf, OverlapModifier::Double, OverlapModifier::Triple,
        OverlapModifier::Quadruple
    };
    for (OverlapModifier modifier : kAll) {
        if (name == OverlapModifierToString(modifier)) {
            return modifier;
        }
    }
    throw std::invalid_argument("Unknown overlap modifier: " + name);
}

} // namespace Building
} // namespace Lodestone
