#pragma once

#include "core/input.h"
#include "sim/simulation.h"

#include <cstdint>

struct GLFWwindow;

// App subsystem
// Responsible for: coordinating startup, the fixed-step frame loop, device polling, and shutdown.
// Should NOT do: contain gameplay rules or collision policy.
namespace layerfall::app {

class App {
public:
    bool init(const sim::SimConfig& config);
    void run();
    void update(float dt);
    void shutdown();

private:
    void pollInput();
    void logTickEvents() const;
    void updateWindowTitle();

    GLFWwindow* m_window = nullptr;
    sim::Simulation m_simulation;
    core::InputState m_input;

    bool m_quitRequested = false;
    bool m_hasMouseSample = false;
    double m_lastMouseX = 0.0;
    double m_lastMouseY = 0.0;
    float m_titleRefreshSeconds = 0.0f;
    sim::SessionState m_lastReportedState = sim::SessionState::Playing;
};

} // namespace layerfall::app
