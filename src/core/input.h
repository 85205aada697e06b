#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// Core Input subsystem
// Responsible for: the canonical set of player actions and their per-tick key state.
// Should NOT do: device polling or window ownership.
namespace layerfall::core {

enum class InputAction : std::uint8_t {
    MoveForward = 0,
    MoveBackward,
    MoveLeft,
    MoveRight,
    JumpModifier,
    Attack,
    PlaceBlock,
    ToggleShop,
    ToggleCastleBuilder,
    BuyHeal,
    BuyHealthUpgrade,
    BuyAttackUpgrade,
    BuyVoidEscape,
    BuildCastle,
    Quit,
    Count
};

inline constexpr std::size_t kInputActionCount = static_cast<std::size_t>(InputAction::Count);

inline constexpr std::array<InputAction, 4> kMovementActions{
    InputAction::MoveForward,
    InputAction::MoveBackward,
    InputAction::MoveLeft,
    InputAction::MoveRight
};

// Maps host key names ("ArrowUp", "Up", "w", "KeyW", "Shift", ...) onto actions.
[[nodiscard]] std::optional<InputAction> resolveInputAlias(std::string_view alias);
[[nodiscard]] const char* inputActionName(InputAction action);

class InputState {
public:
    void setDown(InputAction action, bool down);
    void addDrag(float deltaX, float deltaY);

    [[nodiscard]] bool isDown(InputAction action) const;
    // True only on the first tick the action is held.
    [[nodiscard]] bool wasPressed(InputAction action) const;
    [[nodiscard]] bool anyMovementDown() const;

    [[nodiscard]] float dragDeltaX() const { return m_dragDeltaX; }
    [[nodiscard]] float dragDeltaY() const { return m_dragDeltaY; }

    // Called once per simulation tick after the tick consumed the state.
    void endTick();
    void clear();

private:
    static std::size_t indexOf(InputAction action) { return static_cast<std::size_t>(action); }

    std::array<bool, kInputActionCount> m_down{};
    std::array<bool, kInputActionCount> m_previous{};
    float m_dragDeltaX = 0.0f;
    float m_dragDeltaY = 0.0f;
};

} // namespace layerfall::core
