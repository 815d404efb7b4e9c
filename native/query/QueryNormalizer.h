/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef QueryNormalizer_H_
#define QueryNormalizer_H_

#include "../Base.h"
#include "../events/Preference.h"
#include <string>
#include <utility>

namespace tapsight {

    /// Sentinel position of "last": resolved against the list length at lookup time
    constexpr int LastPosition = -1;

    /**
     * @brief "Nth item of type T" part of a query
     */
    struct OrdinalQuery {
        OrdinalQuery(int position, std::string itemType)
                : position(position), itemType(std::move(itemType)) {}

        /// 1-based list position, or LastPosition
        int position;
        std::string itemType;
    };

    typedef std::shared_ptr<OrdinalQuery> OrdinalQueryPtr;

    /**
     * @brief A raw query after normalization
     *
     * working is the lower-cased trimmed query; searchText is working with
     * filler words removed and is what the text tiers search for.
     */
    class NormalizedQuery : public Serializable {
    public:
        std::string toString() const override;

        bool isEmpty() const { return this->working.empty(); }

        bool isOrdinal() const { return nullptr != this->ordinal; }

        std::string raw;
        std::string working;
        std::string searchText;
        bool requiresVision{false};
        OrdinalQueryPtr ordinal;
    };

    typedef std::shared_ptr<NormalizedQuery> NormalizedQueryPtr;

    /**
     * @brief Turns free text into the query shape the matchers consume
     *
     * All vocabularies come from Preference, so the normalizer itself holds
     * no mutable state and is safe to share.
     */
    class QueryNormalizer {
    public:
        explicit QueryNormalizer(PreferencePtr preference);

        NormalizedQueryPtr normalize(const std::string &rawQuery) const;

        /**
         * @brief Detect "[verb] [on] [the] <ordinal> <item type>"
         *
         * @param working lower-cased trimmed query
         * @return nullptr when the query does not name a list position
         */
        OrdinalQueryPtr detectOrdinal(const std::string &working) const;

        /// True when any visual-only word or phrase occurs as whole tokens in the query
        bool requiresVision(const std::string &working) const;

        /// Drop stop words; if that empties the query drop only verbs; never return empty for non-empty input
        std::string cleanSearchText(const std::string &working) const;

        /// Ordinal position rendered back into words for the vision model, e.g. "the second video"
        static std::string ordinalPhrase(int position, const std::string &itemType);

        /// Position named by an ordinal word, 0 when the word is not ordinal
        static int ordinalPosition(const std::string &word);

    private:
        PreferencePtr _preference;
    };

    typedef std::shared_ptr<QueryNormalizer> QueryNormalizerPtr;

}

#endif //QueryNormalizer_H_
