#include "TradingPanelState.h"

#include <algorithm>

namespace Frontend {

TradingPanelState::TradingPanelState(int viewportWidth, int viewportHeight)
    : m_viewportWidth(viewportWidth),
      m_viewportHeight(viewportHeight),
      m_visible(false),
      m_position(defaultPosition()),
      m_size{DEFAULT_WIDTH, DEFAULT_HEIGHT} {}

PanelPosition TradingPanelState::defaultPosition() const {
    return PanelPosition{std::max(0, m_viewportWidth - DEFAULT_RIGHT_OFFSET), DEFAULT_TOP};
}

void TradingPanelState::ToggleVisibility() {
    m_visible = !m_visible;
}

void TradingPanelState::SetPosition(int x, int y) {
    m_position = PanelPosition{x, y};
    clampPosition();
}

void TradingPanelState::SetSize(int width, int height) {
    m_size.width = std::max(MIN_WIDTH, std::min(MAX_WIDTH, width));
    m_size.height = std::max(MIN_HEIGHT, std::min(MAX_HEIGHT, height));
    clampPosition();
}

void TradingPanelState::ResetPosition() {
    m_visible = false;
    m_position = defaultPosition();
    m_size = PanelSize{DEFAULT_WIDTH, DEFAULT_HEIGHT};
}

void TradingPanelState::SetViewport(int width, int height) {
    m_viewportWidth = width;
    m_viewportHeight = height;
    clampPosition();
}

bool TradingPanelState::CanTriggerSettlement(bool tradingEnabled, bool settlementInFlight) const {
    return IsShown() && tradingEnabled && !settlementInFlight;
}

void TradingPanelState::clampPosition() {
    // The panel never leaves the viewport; an oversized panel pins to the top-left corner
    int max_x = std::max(0, m_viewportWidth - m_size.width);
    int max_y = std::max(0, m_viewportHeight - m_size.height);
    m_position.x = std::max(0, std::min(m_position.x, max_x));
    m_position.y = std::max(0, std::min(m_position.y, max_y));
}

} // namespace Frontend
