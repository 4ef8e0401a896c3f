/**
 * ThumbCache - Viewport visibility oracle implementation
 */

#include "view/viewport_visibility.hpp"

namespace thumbcache {

bool frameIntersectsViewport(const brls::Rect& frame, float viewportWidth, float viewportHeight, float margin) {
    return frame.getMaxY() >= -margin &&
           frame.getMinY() <= viewportHeight + margin &&
           frame.getMaxX() >= -margin &&
           frame.getMinX() <= viewportWidth + margin;
}

ViewportVisibilityOracle::ViewportVisibilityOracle(float margin)
    : m_margin(margin) {
}

bool ViewportVisibilityOracle::isVisible(VisibilityRef ref) const {
    if (!ref) return true;

    // borealis frame getters are not const; the view is only read here
    brls::View* view = static_cast<brls::View*>(const_cast<void*>(ref));
    // Hidden views never count as on screen, wherever their frame sits
    if (view->getVisibility() != brls::Visibility::VISIBLE) return false;

    return frameIntersectsViewport(view->getFrame(), brls::Application::contentWidth,
                                   brls::Application::contentHeight, m_margin);
}

} // namespace thumbcache
