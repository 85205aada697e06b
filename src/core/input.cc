#include "core/input.h"

namespace layerfall::core {
namespace {

struct InputAliasEntry {
    std::string_view alias;
    InputAction action;
};

constexpr InputAliasEntry kInputAliases[] = {
    {"ArrowUp", InputAction::MoveForward},
    {"Up", InputAction::MoveForward},
    {"w", InputAction::MoveForward},
    {"W", InputAction::MoveForward},
    {"KeyW", InputAction::MoveForward},
    {"ArrowDown", InputAction::MoveBackward},
    {"Down", InputAction::MoveBackward},
    {"s", InputAction::MoveBackward},
    {"S", InputAction::MoveBackward},
    {"KeyS", InputAction::MoveBackward},
    {"ArrowLeft", InputAction::MoveLeft},
    {"Left", InputAction::MoveLeft},
    {"a", InputAction::MoveLeft},
    {"A", InputAction::MoveLeft},
    {"KeyA", InputAction::MoveLeft},
    {"ArrowRight", InputAction::MoveRight},
    {"Right", InputAction::MoveRight},
    {"d", InputAction::MoveRight},
    {"D", InputAction::MoveRight},
    {"KeyD", InputAction::MoveRight},
    {"Shift", InputAction::JumpModifier},
    {"ShiftLeft", InputAction::JumpModifier},
    {"ShiftRight", InputAction::JumpModifier},
    {" ", InputAction::Attack},
    {"Space", InputAction::Attack},
    {"e", InputAction::PlaceBlock},
    {"E", InputAction::PlaceBlock},
    {"KeyE", InputAction::PlaceBlock},
    {"b", InputAction::ToggleShop},
    {"B", InputAction::ToggleShop},
    {"KeyB", InputAction::ToggleShop},
    {"c", InputAction::ToggleCastleBuilder},
    {"C", InputAction::ToggleCastleBuilder},
    {"KeyC", InputAction::ToggleCastleBuilder},
    {"1", InputAction::BuyHeal},
    {"Digit1", InputAction::BuyHeal},
    {"2", InputAction::BuyHealthUpgrade},
    {"Digit2", InputAction::BuyHealthUpgrade},
    {"3", InputAction::BuyAttackUpgrade},
    {"Digit3", InputAction::BuyAttackUpgrade},
    {"4", InputAction::BuyVoidEscape},
    {"Digit4", InputAction::BuyVoidEscape},
    {"5", InputAction::BuildCastle},
    {"Digit5", InputAction::BuildCastle},
    {"Escape", InputAction::Quit},
};

} // namespace

std::optional<InputAction> resolveInputAlias(std::string_view alias) {
    for (const InputAliasEntry& entry : kInputAliases) {
        if (entry.alias == alias) {
            return entry.action;
        }
    }
    return std::nullopt;
}

const char* inputActionName(InputAction action) {
    switch (action) {
    case InputAction::MoveForward:
        return "MoveForward";
    case InputAction::MoveBackward:
        return "MoveBackward";
    case InputAction::MoveLeft:
        return "MoveLeft";
    case InputAction::MoveRight:
        return "MoveRight";
    case InputAction::JumpModifier:
        return "JumpModifier";
    case InputAction::Attack:
        return "Attack";
    case InputAction::PlaceBlock:
        return "PlaceBlock";
    case InputAction::ToggleShop:
        return "ToggleShop";
    case InputAction::ToggleCastleBuilder:
        return "ToggleCastleBuilder";
    case InputAction::BuyHeal:
        return "BuyHeal";
    case InputAction::BuyHealthUpgrade:
        return "BuyHealthUpgrade";
    case InputAction::BuyAttackUpgrade:
        return "BuyAttackUpgrade";
    case InputAction::BuyVoidEscape:
        return "BuyVoidEscape";
    case InputAction::BuildCastle:
        return "BuildCastle";
    case InputAction::Quit:
        return "Quit";
    default:
        return "Unknown";
    }
}

void InputState::setDown(InputAction action, bool down) {
    if (action == InputAction::Count) {
        return;
    }
    m_down[indexOf(action)] = down;
}

void InputState::addDrag(float deltaX, float deltaY) {
    m_dragDeltaX += deltaX;
    m_dragDeltaY += deltaY;
}

bool InputState::isDown(InputAction action) const {
    if (action == InputAction::Count) {
        return false;
    }
    return m_down[indexOf(action)];
}

bool InputState::wasPressed(InputAction action) const {
    if (action == InputAction::Count) {
        return false;
    }
    return m_down[indexOf(action)] && !m_previous[indexOf(action)];
}

bool InputState::anyMovementDown() const {
    for (const InputAction action : kMovementActions) {
        if (isDown(action)) {
            return true;
        }
    }
    return false;
}

void InputState::endTick() {
    m_previous = m_down;
    m_dragDeltaX = 0.0f;
    m_dragDeltaY = 0.0f;
}

void InputState::clear() {
    m_down.fill(false);
    m_previous.fill(false);
    m_dragDeltaX = 0.0f;
    m_dragDeltaY = 0.0f;
}

} // namespace layerfall::core
