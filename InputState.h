#pragma once

#include <bitset>
#include <cstddef>
#include <cstdint>

namespace plat {

    enum class Key : std::uint8_t {
        W = 0, A, S, D,
        Space,
        LeftShift,
        Escape,
        L,
        Up, Down, Left, Right,
        F1,
        COUNT
    };

    inline const char* KeyName(Key k) {
        switch (k) {
        case Key::W:         return "W";
        case Key::A:         return "A";
        case Key::S:         return "S";
        case Key::D:         return "D";
        case Key::Space:     return "Space";
        case Key::LeftShift: return "LeftShift";
        case Key::Escape:    return "Escape";
        case Key::L:         return "L";
        case Key::Up:        return "Up";
        case Key::Down:      return "Down";
        case Key::Left:      return "Left";
        case Key::Right:     return "Right";
        case Key::F1:        return "F1";
        default:             return "?";
        }
    }

    // Set of keys currently held down. Insert on press, erase on release.
    class KeySet {
    public:
        void insert(Key k) noexcept {
            if (k != Key::COUNT) bits_.set(index(k));
        }
        void erase(Key k) noexcept {
            if (k != Key::COUNT) bits_.reset(index(k));
        }
        bool contains(Key k) const noexcept {
            return k != Key::COUNT && bits_.test(index(k));
        }
        bool empty() const noexcept { return bits_.none(); }
        std::size_t size() const noexcept { return bits_.count(); }
        void clear() noexcept { bits_.reset(); }

    private:
        static std::size_t index(Key k) noexcept { return static_cast<std::size_t>(k); }

        std::bitset<static_cast<std::size_t>(Key::COUNT)> bits_;
    };

}
