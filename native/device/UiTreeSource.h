/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef UiTreeSource_H_
#define UiTreeSource_H_

#include "../desc/UiSnapshot.h"
#include <string>

namespace tapsight {

    /**
     * @brief Producer of accessibility tree captures
     */
    class UiTreeSource {
    public:
        /**
         * @brief Capture and parse the current tree
         *
         * @return nullptr when the dump is empty or unparseable
         * @throw DeviceError when the device round trip fails
         */
        virtual UiSnapshotPtr captureTree() = 0;

        /**
         * @brief Repeating list items on the current screen, top-to-bottom then left-to-right
         *
         * @param itemType what the caller is looking for ("video", "post", ...)
         * @return empty when no repeating group is found
         */
        virtual UIElementPtrVec detectListItems(const std::string &itemType) = 0;

        virtual ~UiTreeSource() = default;
    };

    typedef std::shared_ptr<UiTreeSource> UiTreeSourcePtr;

}

#endif //UiTreeSource_H_
