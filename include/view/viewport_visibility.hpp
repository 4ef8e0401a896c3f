/**
 * ThumbCache - Viewport visibility oracle for borealis views
 */

#pragma once

#include <borealis.hpp>
#include "utils/decode_scheduler.hpp"

namespace thumbcache {

// True if frame overlaps the viewport grown by margin on every side
bool frameIntersectsViewport(const brls::Rect& frame, float viewportWidth, float viewportHeight, float margin);

/**
 * Treats a VisibilityRef as a brls::View* and checks its frame against the
 * application content area. Cells pass themselves as the ref when requesting
 * their cover.
 */
class ViewportVisibilityOracle : public VisibilityOracle {
public:
    static constexpr float DEFAULT_MARGIN = 200.0f;  // Preload band around the screen edges

    explicit ViewportVisibilityOracle(float margin = DEFAULT_MARGIN);

    bool isVisible(VisibilityRef ref) const override;

    void setMargin(float margin) { m_margin = margin; }
    float getMargin() const { return m_margin; }

    static VisibilityRef refFor(const brls::View* view) { return static_cast<VisibilityRef>(view); }

private:
    float m_margin;
};

} // namespace thumbcache
