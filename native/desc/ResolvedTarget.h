/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef ResolvedTarget_H_
#define ResolvedTarget_H_

#include "../Base.h"
#include <string>

namespace tapsight {

    /// Resolution strategies, in the order the cascade pays for them
    enum ResolveTier {
        KNOWLEDGE_MAP = 0,
        UI_TREE,
        OCR,
        VISION,
        ORDINAL_LIST,
        ResolveTierSize
    };

    extern const std::string tierName[ResolveTierSize];

    /**
     * @brief The tapped coordinate, which tier produced it, and what it matched
     *
     * Only created after the producing tier's acceptance gate passed and the
     * tap was issued.
     */
    class ResolvedTarget : public Serializable {
    public:
        ResolvedTarget(const Point &point, ResolveTier tier, std::string label, double score);

        const Point &getPoint() const { return this->_point; }

        ResolveTier getTier() const { return this->_tier; }

        const std::string &getLabel() const { return this->_label; }

        /// Overlap score, OCR similarity or model confidence; 1.0 for definitional matches
        double getScore() const { return this->_score; }

        std::string toJson() const;

        std::string toString() const override;

    private:
        Point _point;
        ResolveTier _tier;
        std::string _label;
        double _score;
    };

    typedef std::shared_ptr<ResolvedTarget> ResolvedTargetPtr;

}

#endif //ResolvedTarget_H_
