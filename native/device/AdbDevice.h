/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef AdbDevice_H_
#define AdbDevice_H_

#include "DeviceCommander.h"
#include <mutex>
#include <string>
#include <vector>

namespace tapsight {

    /**
     * @brief DeviceCommander backed by the adb command line client
     *
     * Each call spawns one adb process. The screen size is asked once and
     * cached.
     */
    class AdbDevice : public DeviceCommander {
    public:
        /**
         * @param adbPath adb binary, looked up on PATH when not absolute
         * @param serial device serial passed as -s, empty for the only attached device
         */
        AdbDevice(std::string adbPath, std::string serial);

        std::string shell(const std::string &command) override;

        void tap(int x, int y) override;

        std::string captureScreenshot() override;

        ScreenSize screenSize() override;

        /// Parse "Physical size: WxH" / "Override size: WxH"; the override wins when both are present
        static ScreenSize parseWmSize(const std::string &output);

        /// Wrap an argument in single quotes for /bin/sh
        static std::string quoteArg(const std::string &arg);

    protected:
        /// Run adb with the given arguments, throw DeviceError on a non-zero exit
        std::string runAdb(const std::vector<std::string> &args);

    private:
        std::string _adbPath;
        std::string _serial;

        std::mutex _sizeMutex;
        ScreenSize _screenSize;
    };

}

#endif //AdbDevice_H_
