/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "AbstractMatcher.h"
#include "../utils.hpp"

namespace tapsight {

    AbstractMatcher::AbstractMatcher(PreferencePtr preference, DeviceCommanderPtr device)
            : _preference(std::move(preference)), _device(std::move(device)) {
        if (nullptr == this->_preference)
            this->_preference = Preference::defaults();
    }

    ResolvedTargetPtr AbstractMatcher::attempt(const NormalizedQuery &query) {
        BDLOG("tier %s: trying '%s'", this->getName().c_str(), query.searchText.c_str());
        double startStamp = currentStamp();
        ResolvedTargetPtr target = nullptr;
        try {
            target = this->doAttempt(query);
        } catch (const DeviceError &ex) {
            BLOGE("tier %s: device error, treated as miss: %s", this->getName().c_str(), ex.what());
            return nullptr;
        } catch (const std::exception &ex) {
            BLOGE("tier %s: failed, treated as miss: %s", this->getName().c_str(), ex.what());
            return nullptr;
        }
        double costMs = (currentStamp() - startStamp) * 1000.0;
        if (nullptr == target) {
            BDLOG("tier %s: no match (%.1f ms)", this->getName().c_str(), costMs);
        } else {
            BLOG("tier %s: matched %s (%.1f ms)", this->getName().c_str(), target->toString().c_str(), costMs);
        }
        return target;
    }

    ResolvedTargetPtr AbstractMatcher::tapAndResolve(const Point &point, const std::string &label, double score) {
        this->_device->tap(point.x, point.y);
        return std::make_shared<ResolvedTarget>(point, this->getTier(), label, score);
    }

}
