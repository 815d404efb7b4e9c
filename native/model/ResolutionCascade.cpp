/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "ResolutionCascade.h"
#include "../utils.hpp"
#include <chrono>

namespace tapsight {

    ResolutionCascadePtr ResolutionCascade::create(const PreferencePtr &preference,
                                                   const DeviceCommanderPtr &device,
                                                   const UiTreeSourcePtr &treeSource,
                                                   const OcrEnginePtr &ocrEngine,
                                                   const VisionEnginePtr &visionEngine,
                                                   ScreenshotCachePtr screenshots) {
        MatcherContext context;
        context.preference = preference ? preference : Preference::defaults();
        context.device = device;
        context.treeSource = treeSource;
        context.ocrEngine = ocrEngine;
        context.visionEngine = visionEngine;
        if (nullptr == screenshots) {
            screenshots = std::make_shared<ScreenshotCache>(
                    device, std::chrono::milliseconds(context.preference->getScreenshotTtlMs()));
        }
        context.screenshots = screenshots;
        if (nullptr != visionEngine) {
            try {
                visionEngine->setScreenSize(device->screenSize());
            } catch (const std::exception &ex) {
                LOGW("screen size unknown, vision keeps its default hint: %s", ex.what());
            }
        }
        return std::make_shared<ResolutionCascade>(context);
    }

    ResolutionCascade::ResolutionCascade(const MatcherContext &context)
            : _context(context), _normalizer(context.preference) {
        this->_cascade = MatcherFactory::createCascade(context);
        this->_visionMatcher = MatcherFactory::create(ResolveTier::VISION, context);
        this->_ordinalFinder = MatcherFactory::create(ResolveTier::ORDINAL_LIST, context);
        BLOG("resolution cascade ready, ocr %s, vision %s",
             this->_context.ocrEngine ? "configured" : "off",
             this->_context.visionEngine ? "configured" : "off");
    }

    ResolutionCascade::~ResolutionCascade() {
        this->stopWatching();
    }

    bool ResolutionCascade::resolveAndTap(const std::string &query) {
        return nullptr != this->resolve(query);
    }

    ResolvedTargetPtr ResolutionCascade::resolve(const std::string &query) {
        NormalizedQueryPtr normalized = this->_normalizer.normalize(query);
        if (normalized->isEmpty()) {
            BLOGE("%s", "empty query");
            return nullptr;
        }
        ResolvedTargetPtr target = this->resolveNormalized(*normalized);
        if (nullptr == target)
            BLOGE("not found: %s", normalized->raw.c_str());
        return target;
    }

    ResolvedTargetPtr ResolutionCascade::resolveNormalized(const NormalizedQuery &query) {
        if (query.isOrdinal())
            return this->_ordinalFinder->attempt(query);

        if (query.requiresVision) {
            if (!this->_visionMatcher->isAvailable()) {
                BLOGE("'%s' needs vision but no vision model is available", query.raw.c_str());
                return nullptr;
            }
            return this->_visionMatcher->attempt(query);
        }

        BLOG("searching '%s'", query.searchText.c_str());
        for (const auto &matcher: this->_cascade) {
            if (!matcher->isAvailable()) {
                BDLOG("tier %s unavailable, skipped", matcher->getName().c_str());
                continue;
            }
            ResolvedTargetPtr target = matcher->attempt(query);
            if (nullptr != target)
                return target;
        }
        return nullptr;
    }

    UiSnapshotPtr ResolutionCascade::captureTreeSafely() {
        try {
            return this->_context.treeSource->captureTree();
        } catch (const std::exception &ex) {
            BLOGE("capture ui tree failed: %s", ex.what());
        }
        return nullptr;
    }

    std::vector<std::string> ResolutionCascade::listVisibleText() {
        UiSnapshotPtr snapshot = this->captureTreeSafely();
        if (nullptr == snapshot)
            return std::vector<std::string>();
        return snapshot->visibleTexts();
    }

    std::string ResolutionCascade::describeScreen() {
        UiSnapshotPtr snapshot = this->captureTreeSafely();
        if (nullptr == snapshot)
            return "Unable to analyze screen (UI tree empty)";
        return snapshot->describe();
    }

    void ResolutionCascade::startWatching() {
        if (nullptr != this->_context.visionEngine)
            this->_context.visionEngine->startBackgroundCapture();
    }

    void ResolutionCascade::stopWatching() {
        if (nullptr != this->_context.visionEngine)
            this->_context.visionEngine->stopBackgroundCapture();
    }

}
