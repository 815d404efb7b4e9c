/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "ResolvedTarget.h"
#include <nlohmann/json.hpp>
#include <sstream>

namespace tapsight {

    const std::string tierName[ResolveTierSize] = {
            "KNOWLEDGE_MAP",
            "UI_TREE",
            "OCR",
            "VISION",
            "ORDINAL_LIST",
    };

    ResolvedTarget::ResolvedTarget(const Point &point, ResolveTier tier, std::string label, double score)
            : _point(point), _tier(tier), _label(std::move(label)), _score(score) {
    }

    std::string ResolvedTarget::toJson() const {
        nlohmann::json j;
        j["x"] = this->_point.x;
        j["y"] = this->_point.y;
        j["tier"] = tierName[this->_tier];
        j["label"] = this->_label;
        j["score"] = this->_score;
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::string ResolvedTarget::toString() const {
        std::stringstream strs;
        strs << "{tier: " << tierName[this->_tier] << ", at: " << this->_point.toString()
             << ", label: " << this->_label << ", score: " << this->_score << "}";
        return strs.str();
    }

}
