/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include <cstdio>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include "../utils.hpp"
#include "../Base.h"
#include "../events/Preference.h"
#include "../device/AdbDevice.h"
#include "../device/UiAutomatorTree.h"
#include "../device/ScreenshotCache.h"
#include "../device/OllamaVision.h"
#include "../model/ResolutionCascade.h"

#ifdef TAPSIGHT_OCR_ENABLED
#include "../device/TesseractOcrEngine.h"
#endif

namespace {
    const int ExitResolved = 0;
    const int ExitNotFound = 1;
    const int ExitUsage = 2;
}

int main(int argc, char **argv) {
    CLI::App app{"Resolve a natural-language element description on an Android screen and tap it"};
    std::string configPath;
    std::string knowledgePath;
    std::string serial;
    bool watch = false;
    bool listText = false;
    bool dump = false;
    std::vector<std::string> queryWords;
    app.add_option("--config", configPath, "key=value base config file");
    app.add_option("--knowledge", knowledgePath, "JSON knowledge map and lexicons");
    app.add_option("-s,--serial", serial, "adb device serial");
    app.add_flag("--watch", watch, "pre-capture screenshots in the background while resolving");
    app.add_flag("--list-text", listText, "print the visible texts of the current screen");
    app.add_flag("--dump", dump, "print a summary of the current screen");
    app.add_option("query", queryWords, "what to tap, e.g. \"click subscribe\"");
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &ex) {
        return app.exit(ex) == 0 ? ExitResolved : ExitUsage;
    }
    std::string query = tapsight::joinWords(queryWords);
    tapsight::trimString(query);
    if (query.empty() && !listText && !dump) {
        fprintf(stderr, "%s", app.help().c_str());
        return ExitUsage;
    }

    BLOG("tapsight version %s", TAPSIGHT_VERSION);
    tapsight::PreferencePtr preference = tapsight::Preference::load(configPath, knowledgePath);
    auto device = std::make_shared<tapsight::AdbDevice>(preference->getAdbPath(),
                                                        serial.empty() ? preference->getAdbSerial() : serial);
    auto treeSource = std::make_shared<tapsight::UiAutomatorTree>(device);
    auto screenshots = std::make_shared<tapsight::ScreenshotCache>(
            device, std::chrono::milliseconds(preference->getScreenshotTtlMs()));
    tapsight::OcrEnginePtr ocrEngine = nullptr;
#ifdef TAPSIGHT_OCR_ENABLED
    ocrEngine = std::make_shared<tapsight::TesseractOcrEngine>(preference->getOcrLanguage(),
                                                               preference->getOcrMinConfidence());
#endif
    auto vision = std::make_shared<tapsight::OllamaVision>(preference, screenshots);
    tapsight::ResolutionCascadePtr cascade = tapsight::ResolutionCascade::create(
            preference, device, treeSource, ocrEngine, vision, screenshots);

    if (dump)
        printf("%s\n", cascade->describeScreen().c_str());
    if (listText) {
        for (const auto &text: cascade->listVisibleText())
            printf("%s\n", text.c_str());
    }
    if (query.empty())
        return ExitResolved;

    if (watch)
        cascade->startWatching();
    tapsight::ResolvedTargetPtr target = cascade->resolve(query);
    cascade->stopWatching();
    if (nullptr == target) {
        printf("{\"resolved\":false}\n");
        return ExitNotFound;
    }
    printf("%s\n", target->toJson().c_str());
    return ExitResolved;
}
