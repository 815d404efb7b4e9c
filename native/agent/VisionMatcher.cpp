/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "VisionMatcher.h"
#include "../utils.hpp"

namespace tapsight {

    VisionMatcher::VisionMatcher(PreferencePtr preference, DeviceCommanderPtr device, VisionEnginePtr visionEngine)
            : AbstractMatcher(std::move(preference), std::move(device)), _visionEngine(std::move(visionEngine)) {
    }

    bool VisionMatcher::isAvailable() const {
        return nullptr != this->_visionEngine && this->_visionEngine->isAvailable();
    }

    ScreenSize VisionMatcher::currentScreenSize() {
        try {
            return this->_device->screenSize();
        } catch (const DeviceError &ex) {
            LOGW("screen size unknown, skip edge check: %s", ex.what());
        }
        return ScreenSize();
    }

    bool VisionMatcher::accepts(const VisionResult &result, const ScreenSize &screenSize) const {
        if (!result.hasCoordinates()) {
            BDLOG("vision found nothing: %s", result.description.c_str());
            return false;
        }
        if (result.confidence <= this->_preference->getVisionMinConfidence()) {
            BDLOG("vision confidence %.2f is not above %.2f", result.confidence,
                  this->_preference->getVisionMinConfidence());
            return false;
        }
        if (screenSize.isKnown()) {
            const int margin = this->_preference->getVisionEdgeMargin();
            const Point &point = *result.coordinates;
            if (point.x < margin || point.x > screenSize.width - margin
                || point.y < margin || point.y > screenSize.height - margin) {
                LOGW("vision coordinates %s at screen edge, likely hallucination", point.toString().c_str());
                return false;
            }
        }
        return true;
    }

    ResolvedTargetPtr VisionMatcher::locate(const std::string &description) {
        VisionResultPtr result = this->_visionEngine->findElement(description);
        if (nullptr == result || !this->accepts(*result, this->currentScreenSize())) {
            BLOG("vision could not find: %s", description.c_str());
            return nullptr;
        }
        return this->tapAndResolve(*result->coordinates, result->description, result->confidence);
    }

    ResolvedTargetPtr VisionMatcher::doAttempt(const NormalizedQuery &query) {
        return this->locate(query.raw);
    }

}
