#pragma once

namespace Frontend {

struct PanelPosition {
    int x;
    int y;
};

struct PanelSize {
    int width;
    int height;
};

/**
 * @brief Visibility, position and size of the floating trading panel
 *
 * Pure layout state; knows nothing about rendering. Positions are kept inside the
 * viewport and sizes inside the resize limits.
 */
class TradingPanelState {
public:
    static constexpr int DEFAULT_WIDTH = 400;
    static constexpr int DEFAULT_HEIGHT = 500;
    static constexpr int DEFAULT_RIGHT_OFFSET = 420;
    static constexpr int DEFAULT_TOP = 100;

    static constexpr int MIN_WIDTH = 300;
    static constexpr int MAX_WIDTH = 800;
    static constexpr int MIN_HEIGHT = 400;
    static constexpr int MAX_HEIGHT = 900;

    static constexpr int DESKTOP_MIN_VIEWPORT_WIDTH = 1024;

    TradingPanelState(int viewportWidth, int viewportHeight);

    bool IsVisible() const { return m_visible; }
    PanelPosition Position() const { return m_position; }
    PanelSize Size() const { return m_size; }

    /**
     * @brief True if the panel is actually drawn: visible and on a desktop-sized viewport
     */
    bool IsShown() const { return m_visible && IsDesktop(); }
    bool IsDesktop() const { return m_viewportWidth >= DESKTOP_MIN_VIEWPORT_WIDTH; }

    void ToggleVisibility();
    void SetPosition(int x, int y);
    void SetSize(int width, int height);

    // Back to the initial state: hidden, default position and size
    void ResetPosition();

    void SetViewport(int width, int height);

    bool CanTriggerSettlement(bool tradingEnabled, bool settlementInFlight) const;

private:
    PanelPosition defaultPosition() const;
    void clampPosition();

    int m_viewportWidth;
    int m_viewportHeight;
    bool m_visible;
    PanelPosition m_position;
    PanelSize m_size;
};

} // namespace Frontend
