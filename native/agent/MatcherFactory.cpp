/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#include "MatcherFactory.h"
#include "KnowledgeMapMatcher.h"
#include "UiTreeMatcher.h"
#include "OcrMatcher.h"
#include "VisionMatcher.h"
#include "OrdinalItemFinder.h"

namespace tapsight {

    AbstractMatcherPtr MatcherFactory::create(ResolveTier tier, const MatcherContext &context) {
        switch (tier) {
            case ResolveTier::KNOWLEDGE_MAP:
                return std::make_shared<KnowledgeMapMatcher>(context.preference, context.device,
                                                             context.treeSource);
            case ResolveTier::UI_TREE:
                return std::make_shared<UiTreeMatcher>(context.preference, context.device, context.treeSource);
            case ResolveTier::OCR:
                return std::make_shared<OcrMatcher>(context.preference, context.device, context.ocrEngine,
                                                    context.screenshots);
            case ResolveTier::VISION:
                return std::make_shared<VisionMatcher>(context.preference, context.device, context.visionEngine);
            case ResolveTier::ORDINAL_LIST:
                return std::make_shared<OrdinalItemFinder>(
                        context.preference, context.device, context.treeSource,
                        std::make_shared<VisionMatcher>(context.preference, context.device, context.visionEngine));
            default:
                break;
        }
        return nullptr;
    }

    AbstractMatcherPtrVec MatcherFactory::createCascade(const MatcherContext &context) {
        AbstractMatcherPtrVec matchers;
        for (ResolveTier tier: {ResolveTier::KNOWLEDGE_MAP, ResolveTier::UI_TREE, ResolveTier::OCR,
                                ResolveTier::VISION}) {
            matchers.push_back(create(tier, context));
        }
        return matchers;
    }

}
