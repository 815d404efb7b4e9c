/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "AdbDevice.h"
#include "../utils.hpp"
#include <cstdio>
#include <regex>
#include <sys/wait.h>

namespace tapsight {

    namespace {
        const std::regex &getPhysicalSizeRegex() {
            static const std::regex r("Physical size:\\s*(\\d+)x(\\d+)");
            return r;
        }

        const std::regex &getOverrideSizeRegex() {
            static const std::regex r("Override size:\\s*(\\d+)x(\\d+)");
            return r;
        }
    }

    AdbDevice::AdbDevice(std::string adbPath, std::string serial)
            : _adbPath(std::move(adbPath)), _serial(std::move(serial)) {
        if (this->_adbPath.empty())
            this->_adbPath = "adb";
    }

    std::string AdbDevice::quoteArg(const std::string &arg) {
        std::string quoted(arg);
        stringReplaceAll(quoted, "'", "'\\''");
        return "'" + quoted + "'";
    }

    std::string AdbDevice::runAdb(const std::vector<std::string> &args) {
        std::string commandLine = quoteArg(this->_adbPath);
        if (!this->_serial.empty())
            commandLine += " -s " + quoteArg(this->_serial);
        for (const auto &arg: args)
            commandLine += " " + quoteArg(arg);
        commandLine += " 2>/dev/null";
        BDLOG("run %s", commandLine.c_str());

        FILE *pipe = popen(commandLine.c_str(), "r");
        if (nullptr == pipe)
            throw DeviceError("cannot spawn adb: " + commandLine);
        std::string output;
        char buffer[4096];
        size_t readBytes = 0;
        while ((readBytes = fread(buffer, 1, sizeof(buffer), pipe)) > 0)
            output.append(buffer, readBytes);
        int status = pclose(pipe);
        if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            throw DeviceError("adb failed (status " + std::to_string(status) + "): " + commandLine);
        }
        return output;
    }

    std::string AdbDevice::shell(const std::string &command) {
        // adb shell joins its arguments into one remote command line
        return this->runAdb({"shell", command});
    }

    void AdbDevice::tap(int x, int y) {
        BLOG("tap (%d, %d)", x, y);
        this->shell("input tap " + std::to_string(x) + " " + std::to_string(y));
    }

    std::string AdbDevice::captureScreenshot() {
        std::string png = this->runAdb({"exec-out", "screencap", "-p"});
        if (png.empty())
            throw DeviceError("screencap returned no data");
        BDLOG("screenshot %zu bytes", png.size());
        return png;
    }

    ScreenSize AdbDevice::parseWmSize(const std::string &output) {
        ScreenSize size;
        std::smatch result;
        if (std::regex_search(output, result, getOverrideSizeRegex())
            || std::regex_search(output, result, getPhysicalSizeRegex())) {
            size.width = std::stoi(result[1].str());
            size.height = std::stoi(result[2].str());
        }
        return size;
    }

    ScreenSize AdbDevice::screenSize() {
        std::lock_guard<std::mutex> lock(this->_sizeMutex);
        if (this->_screenSize.isKnown())
            return this->_screenSize;
        std::string output = this->shell("wm size");
        ScreenSize size = parseWmSize(output);
        if (!size.isKnown())
            throw DeviceError("cannot parse wm size output: " + output);
        this->_screenSize = size;
        BLOG("screen size %dx%d", size.width, size.height);
        return size;
    }

}
