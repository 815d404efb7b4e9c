/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Base_H_
#define Base_H_

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace tapsight {

    /**
     * @brief Base class of everything that can print itself into logs
     */
    class Serializable {
    public:
        virtual std::string toString() const = 0;

        virtual ~Serializable() = default;
    };

    /**
     * @brief A coordinate in device pixel space
     */
    class Point : public Serializable {
    public:
        Point();

        Point(int x, int y);

        bool operator==(const Point &other) const;

        bool operator!=(const Point &other) const { return !(*this == other); }

        std::string toString() const override;

        int x;
        int y;
    };

    typedef std::shared_ptr<Point> PointPtr;

    /**
     * @brief Axis-aligned rectangle in device pixel space, as reported by uiautomator
     *
     * Bounds are inclusive on every side. A rectangle whose right
     * is not greater than its left (or bottom not greater than top) is empty.
     */
    class Rect : public Serializable {
    public:
        Rect();

        Rect(int left, int top, int right, int bottom);

        bool isEmpty() const;

        /// Tap point: integer midpoint, rounding toward the top-left
        Point center() const;

        int width() const { return this->right - this->left; }

        int height() const { return this->bottom - this->top; }

        bool operator==(const Rect &other) const;

        std::string toString() const override;

        int top;
        int bottom;
        int left;
        int right;
    };

    /// Device pixel dimensions of the screen
    struct ScreenSize {
        int width{0};
        int height{0};

        bool isKnown() const { return width > 0 && height > 0; }
    };

    // ---------------- string helpers ----------------

    void splitString(const std::string &str, std::vector<std::string> &result, char delimiter);

    /// Split on any run of whitespace, dropping empty tokens
    std::vector<std::string> splitWords(const std::string &str);

    std::string joinWords(const std::vector<std::string> &words, const std::string &separator = " ");

    void trimString(std::string &str);

    void stringReplaceAll(std::string &str, const std::string &from, const std::string &to);

    /// ASCII lower-casing; multi-byte sequences are left untouched
    std::string toLowerCopy(const std::string &str);

    /// Ratcliff/Obershelp similarity: 2 * matched / (len(a) + len(b)), 1.0 for two empty strings
    double sequenceSimilarity(const std::string &a, const std::string &b);

    std::string base64Encode(const std::string &bytes);

    // ---------------- time and files ----------------

    /// Seconds since epoch with sub-millisecond precision
    double currentStamp();

    std::string loadFileContent(const std::string &fileAbsolutePath);

    template<typename T>
    T getJsonValue(const nlohmann::json &jsonObj, const char *key, const T &defaultValue) {
        auto iter = jsonObj.find(key);
        if (iter == jsonObj.end() || iter->is_null())
            return defaultValue;
        try {
            return iter->template get<T>();
        } catch (const nlohmann::json::exception &) {
            return defaultValue;
        }
    }

}

#endif //Base_H_
