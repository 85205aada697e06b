#include "app/app.h"

#include <GLFW/glfw3.h>

#include "core/log.h"
#include "sim/events.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

namespace {

constexpr double kSimulationFixedStepSeconds = 1.0 / static_cast<double>(layerfall::sim::kTicksPerSecond);
constexpr double kFrameDeltaClampSeconds = 0.25;
constexpr int kMaxSimulationStepsPerFrame = 8;
constexpr float kTitleRefreshIntervalSeconds = 0.25f;

struct KeyBinding {
    int key = GLFW_KEY_UNKNOWN;
    layerfall::core::InputAction action = layerfall::core::InputAction::Count;
};

constexpr std::array<KeyBinding, 21> kKeyBindings = {{
    {GLFW_KEY_W, layerfall::core::InputAction::MoveForward},
    {GLFW_KEY_UP, layerfall::core::InputAction::MoveForward},
    {GLFW_KEY_S, layerfall::core::InputAction::MoveBackward},
    {GLFW_KEY_DOWN, layerfall::core::InputAction::MoveBackward},
    {GLFW_KEY_A, layerfall::core::InputAction::MoveLeft},
    {GLFW_KEY_LEFT, layerfall::core::InputAction::MoveLeft},
    {GLFW_KEY_D, layerfall::core::InputAction::MoveRight},
    {GLFW_KEY_RIGHT, layerfall::core::InputAction::MoveRight},
    {GLFW_KEY_LEFT_SHIFT, layerfall::core::InputAction::JumpModifier},
    {GLFW_KEY_RIGHT_SHIFT, layerfall::core::InputAction::JumpModifier},
    {GLFW_KEY_SPACE, layerfall::core::InputAction::Attack},
    {GLFW_KEY_E, layerfall::core::InputAction::PlaceBlock},
    {GLFW_KEY_B, layerfall::core::InputAction::ToggleShop},
    {GLFW_KEY_C, layerfall::core::InputAction::ToggleCastleBuilder},
    {GLFW_KEY_1, layerfall::core::InputAction::BuyHeal},
    {GLFW_KEY_2, layerfall::core::InputAction::BuyHealthUpgrade},
    {GLFW_KEY_3, layerfall::core::InputAction::BuyAttackUpgrade},
    {GLFW_KEY_4, layerfall::core::InputAction::BuyVoidEscape},
    {GLFW_KEY_5, layerfall::core::InputAction::BuildCastle},
    {GLFW_KEY_KP_5, layerfall::core::InputAction::BuildCastle},
    {GLFW_KEY_ESCAPE, layerfall::core::InputAction::Quit},
}};

void glfwErrorCallback(int errorCode, const char* description) {
    LF_LOGE("glfw") << "error " << errorCode << ": "
                    << (description != nullptr ? description : "(no description)");
}

} // namespace

namespace layerfall::app {

bool App::init(const sim::SimConfig& config) {
    using Clock = std::chrono::steady_clock;
    const auto initStart = Clock::now();
    auto elapsedMs = [](const Clock::time_point& start) -> std::int64_t {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    };

    LF_LOGI("app") << "init begin";
    glfwSetErrorCallback(glfwErrorCallback);

    const auto glfwStart = Clock::now();
    if (glfwInit() == GLFW_FALSE) {
        LF_LOGE("app") << "glfwInit failed";
        return false;
    }
    LF_LOGI("app") << "init step glfwInit took " << elapsedMs(glfwStart) << " ms";

    // No client API: the window only carries input and the title-bar status line.
    const auto windowStart = Clock::now();
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    m_window = glfwCreateWindow(1280, 720, "layerfall", nullptr, nullptr);
    if (m_window == nullptr) {
        LF_LOGE("app") << "glfwCreateWindow failed";
        glfwTerminate();
        return false;
    }
    LF_LOGI("app") << "init step createWindow took " << elapsedMs(windowStart) << " ms";
    for (const KeyBinding& binding : kKeyBindings) {
        LF_LOGT("app") << "key " << binding.key << " -> " << core::inputActionName(binding.action);
    }

    const auto simInitStart = Clock::now();
    if (!m_simulation.reset(config)) {
        LF_LOGE("app") << "simulation reset failed";
        shutdown();
        return false;
    }
    LF_LOGI("app") << "init step simulation reset took " << elapsedMs(simInitStart) << " ms";

    updateWindowTitle();
    LF_LOGI("app") << "init complete in " << elapsedMs(initStart) << " ms";
    return true;
}

void App::run() {
    LF_LOGI("app") << "run begin";
    double previousTime = glfwGetTime();
    double simulationAccumulatorSeconds = 0.0;
    std::uint64_t frameCount = 0;

    while (m_window != nullptr && glfwWindowShouldClose(m_window) == GLFW_FALSE) {
        const double currentTime = glfwGetTime();
        const double rawFrameSeconds = std::max(0.0, currentTime - previousTime);
        previousTime = currentTime;
        const double frameSeconds = std::min(rawFrameSeconds, kFrameDeltaClampSeconds);
        simulationAccumulatorSeconds += frameSeconds;

        pollInput();
        if (m_quitRequested) {
            glfwSetWindowShouldClose(m_window, GLFW_TRUE);
            break;
        }

        int simulationStepCount = 0;
        while (simulationAccumulatorSeconds >= kSimulationFixedStepSeconds &&
               simulationStepCount < kMaxSimulationStepsPerFrame) {
            m_simulation.tick(m_input);
            m_input.endTick();
            logTickEvents();
            simulationAccumulatorSeconds -= kSimulationFixedStepSeconds;
            ++simulationStepCount;
        }
        if (simulationStepCount == kMaxSimulationStepsPerFrame &&
            simulationAccumulatorSeconds >= kSimulationFixedStepSeconds) {
            // Drop excess backlog to keep simulation responsive after long stalls.
            simulationAccumulatorSeconds = std::fmod(simulationAccumulatorSeconds, kSimulationFixedStepSeconds);
        }

        update(static_cast<float>(frameSeconds));
        ++frameCount;
    }

    LF_LOGI("app") << "run exit after " << frameCount
                   << " frame(s), tick " << m_simulation.tickCount();
}

void App::update(float dt) {
    const sim::SessionState state = m_simulation.state();
    if (state != m_lastReportedState) {
        m_lastReportedState = state;
        updateWindowTitle();
        m_titleRefreshSeconds = 0.0f;
        return;
    }

    m_titleRefreshSeconds += dt;
    if (m_titleRefreshSeconds >= kTitleRefreshIntervalSeconds) {
        m_titleRefreshSeconds = 0.0f;
        updateWindowTitle();
    }
}

void App::shutdown() {
    LF_LOGI("app") << "shutdown begin";

    if (m_window != nullptr) {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }

    glfwTerminate();
    LF_LOGI("app") << "shutdown complete";
}

void App::pollInput() {
    glfwPollEvents();

    std::array<bool, core::kInputActionCount> down{};
    for (const KeyBinding& binding : kKeyBindings) {
        if (glfwGetKey(m_window, binding.key) == GLFW_PRESS) {
            down[static_cast<std::size_t>(binding.action)] = true;
        }
    }
    for (std::size_t i = 0; i < core::kInputActionCount; ++i) {
        m_input.setDown(static_cast<core::InputAction>(i), down[i]);
    }
    m_quitRequested = down[static_cast<std::size_t>(core::InputAction::Quit)];

    double mouseX = 0.0;
    double mouseY = 0.0;
    glfwGetCursorPos(m_window, &mouseX, &mouseY);
    if (!m_hasMouseSample) {
        m_lastMouseX = mouseX;
        m_lastMouseY = mouseY;
        m_hasMouseSample = true;
    }

    // Camera orbit follows the pointer only while a button is held.
    const bool dragging =
        glfwGetMouseButton(m_window, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS ||
        glfwGetMouseButton(m_window, GLFW_MOUSE_BUTTON_RIGHT) == GLFW_PRESS;
    if (dragging) {
        m_input.addDrag(static_cast<float>(mouseX - m_lastMouseX), static_cast<float>(mouseY - m_lastMouseY));
    }

    m_lastMouseX = mouseX;
    m_lastMouseY = mouseY;
}

void App::logTickEvents() const {
    if (!core::shouldLog(core::LogLevel::Debug)) {
        return;
    }
    for (const sim::SimEvent& event : m_simulation.events()) {
        LF_LOGD("app") << "tick " << m_simulation.tickCount() << " event " << sim::simEventKindName(event.kind)
                       << " subject=" << event.subjectId << " amount=" << event.amount;
    }
}

void App::updateWindowTitle() {
    if (m_window == nullptr) {
        return;
    }
    const sim::WorldContext& context = m_simulation.context();
    const sim::Player& player = context.player;

    std::ostringstream title;
    title << "layerfall | HP " << player.health << "/" << player.maxHealth
          << " | coins " << player.coins
          << " | wood " << player.wood
          << " | kills " << context.kills
          << " | monsters " << context.monsters.size();
    if (player.hasVoidEscape) {
        title << " | escape ready";
    }
    if (player.stuckInVoid) {
        title << " | TRAPPED";
    }
    if (context.shopOpen) {
        title << " | shop: 1 heal, 2 health+, 3 attack+, 4 escape";
    }
    if (context.castleBuilderOpen) {
        title << " | castle: 5 to build";
    }
    if (context.state == sim::SessionState::GameOver) {
        title << " | GAME OVER";
    }
    glfwSetWindowTitle(m_window, title.str().c_str());
}

} // namespace layerfall::app
