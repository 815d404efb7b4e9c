/*
 * Hand-written collaborators for resolver tests
 */
#ifndef FakeCollaborators_H_
#define FakeCollaborators_H_

#include "../device/DeviceCommander.h"
#include "../device/OcrEngine.h"
#include "../device/UiTreeSource.h"
#include "../device/VisionEngine.h"
#include <deque>
#include <string>
#include <vector>

namespace tapsight {

    class FakeDevice : public DeviceCommander {
    public:
        std::string shell(const std::string &command) override {
            shellCommands.push_back(command);
            if (failShell)
                throw DeviceError("adb link down");
            return shellOutput;
        }

        void tap(int x, int y) override {
            if (failTap)
                throw DeviceError("tap failed");
            taps.emplace_back(x, y);
        }

        std::string captureScreenshot() override {
            screenshotCalls++;
            if (failScreenshot)
                throw DeviceError("screencap failed");
            return "png-bytes-" + std::to_string(screenshotCalls);
        }

        ScreenSize screenSize() override {
            if (!size.isKnown())
                throw DeviceError("wm size failed");
            return size;
        }

        std::vector<Point> taps;
        std::vector<std::string> shellCommands;
        std::string shellOutput;
        int screenshotCalls{0};
        bool failShell{false};
        bool failTap{false};
        bool failScreenshot{false};
        ScreenSize size{1080, 2400};
    };

    class FakeUiTreeSource : public UiTreeSource {
    public:
        UiSnapshotPtr captureTree() override {
            captureCalls++;
            if (failCapture)
                throw DeviceError("uiautomator dump failed");
            if (elements.empty())
                return nullptr;
            return std::make_shared<UiSnapshot>(elements);
        }

        UIElementPtrVec detectListItems(const std::string &itemType) override {
            listCalls++;
            lastItemType = itemType;
            if (failListItems)
                throw DeviceError("uiautomator dump failed");
            return listItems;
        }

        UIElementPtrVec elements;
        UIElementPtrVec listItems;
        std::string lastItemType;
        int captureCalls{0};
        int listCalls{0};
        bool failCapture{false};
        bool failListItems{false};
    };

    class FakeOcrEngine : public OcrEngine {
    public:
        FakeOcrEngine()
                : OcrEngine(0.6) {}

        bool isAvailable() const override { return available; }

        OcrMatchPtrVec extractText(const ScreenCapturePtr &capture) override {
            extractCalls++;
            (void) capture;
            return runs;
        }

        OcrMatchPtrVec runs;
        bool available{true};
        int extractCalls{0};
    };

    class FakeVisionEngine : public VisionEngine {
    public:
        bool isAvailable() const override { return available; }

        VisionResultPtr findElement(const std::string &description) override {
            descriptions.push_back(description);
            if (failRequest)
                throw std::runtime_error("ollama unreachable");
            if (!results.empty()) {
                VisionResultPtr result = results.front();
                results.pop_front();
                return result;
            }
            return std::make_shared<VisionResult>("nothing", 0.0);
        }

        void setScreenSize(const ScreenSize &screenSize) override { screenHint = screenSize; }

        void startBackgroundCapture() override { startCalls++; }

        void stopBackgroundCapture() override { stopCalls++; }

        std::deque<VisionResultPtr> results;
        std::vector<std::string> descriptions;
        ScreenSize screenHint;
        bool available{true};
        bool failRequest{false};
        int startCalls{0};
        int stopCalls{0};
    };

    inline UIElementPtr makeElement(const std::string &text, const std::string &contentDesc,
                                    const Rect &bounds, bool clickable = true,
                                    const std::string &classname = "android.widget.TextView") {
        return std::make_shared<UIElement>(text, contentDesc, classname, bounds, clickable);
    }

}

#endif //FakeCollaborators_H_
