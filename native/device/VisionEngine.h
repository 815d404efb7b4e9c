/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef VisionEngine_H_
#define VisionEngine_H_

#include "../desc/VisionResult.h"
#include <string>

namespace tapsight {

    /**
     * @brief Vision-language model able to point at a described element
     */
    class VisionEngine {
    public:
        /// False when the model is not installed or its server is unreachable
        virtual bool isAvailable() const = 0;

        /**
         * @brief Localize an element on the current screen
         *
         * @param description natural language, e.g. "the red car" or "the second video"
         * @return never null; coordinates are absent when nothing usable was found
         * @throw std::runtime_error when the model server cannot be reached
         */
        virtual VisionResultPtr findElement(const std::string &description) = 0;

        /// Device resolution used in prompts and to validate returned coordinates
        virtual void setScreenSize(const ScreenSize &screenSize) = 0;

        virtual void startBackgroundCapture() = 0;

        virtual void stopBackgroundCapture() = 0;

        virtual ~VisionEngine() = default;
    };

    typedef std::shared_ptr<VisionEngine> VisionEnginePtr;

}

#endif //VisionEngine_H_
