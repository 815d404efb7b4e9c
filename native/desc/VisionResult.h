/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef VisionResult_H_
#define VisionResult_H_

#include "../Base.h"
#include <string>
#include <utility>

namespace tapsight {

    /**
     * @brief What the vision model answered for one localization request
     *
     * coordinates is null when the model found nothing usable.
     */
    class VisionResult : public Serializable {
    public:
        VisionResult(std::string description, double confidence)
                : description(std::move(description)), confidence(confidence) {}

        VisionResult(std::string description, const Point &point, double confidence)
                : description(std::move(description)), coordinates(std::make_shared<Point>(point)),
                  confidence(confidence) {}

        bool hasCoordinates() const { return nullptr != this->coordinates; }

        std::string toString() const override {
            return "VisionResult(description='" + this->description + "', at="
                   + (this->coordinates ? this->coordinates->toString() : std::string("none"))
                   + ", confidence=" + std::to_string(this->confidence) + ")";
        }

        std::string description;
        PointPtr coordinates;
        double confidence;
    };

    typedef std::shared_ptr<VisionResult> VisionResultPtr;

}

#endif //VisionResult_H_
