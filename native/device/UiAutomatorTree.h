/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef UiAutomatorTree_H_
#define UiAutomatorTree_H_

#include "UiTreeSource.h"
#include "DeviceCommander.h"

namespace tapsight {

    /**
     * @brief UiTreeSource reading `uiautomator dump` through the device shell
     */
    class UiAutomatorTree : public UiTreeSource {
    public:
        explicit UiAutomatorTree(DeviceCommanderPtr device);

        UiSnapshotPtr captureTree() override;

        UIElementPtrVec detectListItems(const std::string &itemType) override;

        /**
         * @brief Pick the largest group of same-sized elements in a capture
         *
         * Elements outside the list item size window are ignored, the rest are
         * grouped by size rounded to the nearest bucket. The largest group
         * (first seen on ties) is returned sorted by (top, left) when it has
         * at least ListItemMinCount members.
         */
        static UIElementPtrVec selectListItems(const UiSnapshotPtr &snapshot);

    private:
        DeviceCommanderPtr _device;
    };

}

#endif //UiAutomatorTree_H_
