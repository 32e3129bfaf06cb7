#include "libkeyscore/key_types.hpp"

#include <stdexcept>
#include <string>

namespace libkeyscore {

std::string_view to_string(Hand hand) noexcept {
    switch (hand) {
        case Hand::Left:
            return "Left";
        case Hand::Right:
            return "Right";
    }
    return "Unknown";
}

std::string_view to_string(Finger finger) noexcept {
    switch (finger) {
        case Finger::Thumb:
            return "Thumb";
        case Finger::Index:
            return "Index";
        case Finger::Middle:
            return "Middle";
        case Finger::Ring:
            return "Ring";
        case Finger::Pinky:
            return "Pinky";
    }
    return "Unknown";
}

Hand parse_hand(std::string_view name) {
    if (name == "Left") {
        return Hand::Left;
    }
    if (name == "Right") {
        return Hand::Right;
    }
    throw std::invalid_argument("unknown hand: " + std::string(name));
}

Finger parse_finger(std::string_view name) {
    if (name == "Thumb") {
        return Finger::Thumb;
    }
    if (name == "Index") {
        return Finger::Index;
    }
    if (name == "Middle") {
        return Finger::Middle;
    }
    if (name == "Ring") {
        return Finger::Ring;
    }
    if (name == "Pinky") {
        return Finger::Pinky;
    }
    throw std::invalid_argument("unknown finger: " + std::string(name));
}

}  // namespace libkeyscore
