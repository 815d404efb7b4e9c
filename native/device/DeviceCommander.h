/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef DeviceCommander_H_
#define DeviceCommander_H_

#include "../Base.h"
#include <stdexcept>
#include <string>

namespace tapsight {

    /**
     * @brief Transport failure: the device round trip did not complete
     *
     * Thrown by device collaborators, caught at the matcher boundary and
     * downgraded to a miss of that tier.
     */
    class DeviceError : public std::runtime_error {
    public:
        explicit DeviceError(const std::string &what)
                : std::runtime_error(what) {}
    };

    /**
     * @brief Raw command channel to the controlled device
     *
     * Every call may block on a device round trip and throws DeviceError
     * when it fails.
     */
    class DeviceCommander {
    public:
        /// Run a shell command on the device and return its stdout
        virtual std::string shell(const std::string &command) = 0;

        /// Tap exactly at (x, y) in device pixels
        virtual void tap(int x, int y) = 0;

        /// Encoded (PNG) bytes of the current screen, never empty on success
        virtual std::string captureScreenshot() = 0;

        virtual ScreenSize screenSize() = 0;

        virtual ~DeviceCommander() = default;
    };

    typedef std::shared_ptr<DeviceCommander> DeviceCommanderPtr;

}

#endif //DeviceCommander_H_
