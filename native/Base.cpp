/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef Base_CPP_
#define Base_CPP_

#include "Base.h"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <sstream>
#include <sys/time.h>

namespace tapsight {

    Point::Point()
            : x(0), y(0) {}

    Point::Point(int x, int y)
            : x(x), y(y) {}

    bool Point::operator==(const Point &other) const {
        return this->x == other.x && this->y == other.y;
    }

    std::string Point::toString() const {
        return "(" + std::to_string(this->x) + ", " + std::to_string(this->y) + ")";
    }

    Rect::Rect()
            : top(0), bottom(0), left(0), right(0) {}

    Rect::Rect(int left, int top, int right, int bottom)
            : top(top), bottom(bottom), left(left), right(right) {}

    bool Rect::isEmpty() const {
        return this->right <= this->left || this->bottom <= this->top;
    }

    Point Rect::center() const {
        return Point((this->left + this->right) / 2, (this->top + this->bottom) / 2);
    }

    bool Rect::operator==(const Rect &other) const {
        return this->top == other.top && this->bottom == other.bottom
               && this->left == other.left && this->right == other.right;
    }

    std::string Rect::toString() const {
        std::stringstream strs;
        strs << "[" << this->left << "," << this->top << "][" << this->right << "," << this->bottom << "]";
        return strs.str();
    }

    void splitString(const std::string &str, std::vector<std::string> &result, char delimiter) {
        if (str.empty())
            return;
        std::string::size_type start = 0;
        std::string::size_type pos = str.find(delimiter);
        while (pos != std::string::npos) {
            result.emplace_back(str, start, pos - start);
            start = pos + 1;
            pos = str.find(delimiter, start);
        }
        if (start < str.size())
            result.emplace_back(str, start);
    }

    std::vector<std::string> splitWords(const std::string &str) {
        std::vector<std::string> words;
        std::istringstream stream(str);
        std::string word;
        while (stream >> word) {
            words.push_back(word);
        }
        return words;
    }

    std::string joinWords(const std::vector<std::string> &words, const std::string &separator) {
        std::string joined;
        for (size_t i = 0; i < words.size(); i++) {
            if (i > 0)
                joined += separator;
            joined += words[i];
        }
        return joined;
    }

    void trimString(std::string &str) {
        auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
        str.erase(str.begin(), std::find_if(str.begin(), str.end(), notSpace));
        str.erase(std::find_if(str.rbegin(), str.rend(), notSpace).base(), str.end());
    }

    void stringReplaceAll(std::string &str, const std::string &from, const std::string &to) {
        if (from.empty())
            return;
        std::string::size_type pos = 0;
        while ((pos = str.find(from, pos)) != std::string::npos) {
            str.replace(pos, from.length(), to);
            pos += to.length();
        }
    }

    std::string toLowerCopy(const std::string &str) {
        std::string lowered(str);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(ch < 0x80 ? std::tolower(ch) : ch);
        });
        return lowered;
    }

    namespace {
        // Longest common block first, then recurse on both sides of it
        size_t countMatchedChars(const std::string &a, size_t alo, size_t ahi,
                                 const std::string &b, size_t blo, size_t bhi) {
            if (alo >= ahi || blo >= bhi)
                return 0;
            size_t bestI = alo, bestJ = blo, bestSize = 0;
            std::vector<size_t> previous(b.size() + 1, 0);
            std::vector<size_t> current(b.size() + 1, 0);
            for (size_t i = alo; i < ahi; i++) {
                std::fill(current.begin(), current.end(), 0);
                for (size_t j = blo; j < bhi; j++) {
                    if (a[i] != b[j])
                        continue;
                    size_t k = (j > blo ? previous[j - 1] : 0) + 1;
                    current[j] = k;
                    if (k > bestSize) {
                        bestI = i + 1 - k;
                        bestJ = j + 1 - k;
                        bestSize = k;
                    }
                }
                previous.swap(current);
            }
            if (bestSize == 0)
                return 0;
            return bestSize
                   + countMatchedChars(a, alo, bestI, b, blo, bestJ)
                   + countMatchedChars(a, bestI + bestSize, ahi, b, bestJ + bestSize, bhi);
        }
    }

    double sequenceSimilarity(const std::string &a, const std::string &b) {
        size_t total = a.size() + b.size();
        if (total == 0)
            return 1.0;
        size_t matched = countMatchedChars(a, 0, a.size(), b, 0, b.size());
        return 2.0 * static_cast<double>(matched) / static_cast<double>(total);
    }

    std::string base64Encode(const std::string &bytes) {
        static const char *alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::string encoded;
        encoded.reserve(((bytes.size() + 2) / 3) * 4);
        size_t i = 0;
        for (; i + 2 < bytes.size(); i += 3) {
            uint32_t triple = (static_cast<uint8_t>(bytes[i]) << 16)
                              | (static_cast<uint8_t>(bytes[i + 1]) << 8)
                              | static_cast<uint8_t>(bytes[i + 2]);
            encoded.push_back(alphabet[(triple >> 18) & 0x3F]);
            encoded.push_back(alphabet[(triple >> 12) & 0x3F]);
            encoded.push_back(alphabet[(triple >> 6) & 0x3F]);
            encoded.push_back(alphabet[triple & 0x3F]);
        }
        size_t rest = bytes.size() - i;
        if (rest > 0) {
            uint32_t triple = static_cast<uint8_t>(bytes[i]) << 16;
            if (rest == 2)
                triple |= static_cast<uint8_t>(bytes[i + 1]) << 8;
            encoded.push_back(alphabet[(triple >> 18) & 0x3F]);
            encoded.push_back(alphabet[(triple >> 12) & 0x3F]);
            encoded.push_back(rest == 2 ? alphabet[(triple >> 6) & 0x3F] : '=');
            encoded.push_back('=');
        }
        return encoded;
    }

    std::string getTimeFormatStr() {
        char buffer[32];
        struct timeval tv{};
        gettimeofday(&tv, nullptr);
        struct tm tmNow{};
        localtime_r(&tv.tv_sec, &tmNow);
        size_t len = strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tmNow);
        snprintf(buffer + len, sizeof(buffer) - len, ".%03ld", static_cast<long>(tv.tv_usec / 1000));
        return std::string(buffer);
    }

    double currentStamp() {
        struct timeval tv{};
        gettimeofday(&tv, nullptr);
        return static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) / 1000000.0;
    }

    std::string loadFileContent(const std::string &fileAbsolutePath) {
        std::ifstream fileStringReader(fileAbsolutePath, std::ios::binary);
        if (!fileStringReader.is_open()) {
            BDLOG("open file %s failed", fileAbsolutePath.c_str());
            return "";
        }
        std::stringstream buffer;
        buffer << fileStringReader.rdbuf();
        return buffer.str();
    }

}

#endif //Base_CPP_
