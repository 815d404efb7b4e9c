/*
 * This code is licensed under the Fastbot license. You may obtain a copy of this license in the LICENSE.txt file in the root directory of this source tree.
 */
#ifndef UTILS_HPP_
#define UTILS_HPP_

#ifndef TAPSIGHT_DEBUG_LOG
#define TAPSIGHT_DEBUG_LOG 1
#endif

#define TAG "[Tapsight]"

#include <algorithm>
#include <cstdio>
#include <string>

namespace tapsight {
    std::string getTimeFormatStr();
}

#ifdef __ANDROID__

#include <android/log.h>

#define LOGD(fmt, ...) __android_log_print(ANDROID_LOG_DEBUG,TAG ,fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) __android_log_print(ANDROID_LOG_INFO,TAG ,fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) __android_log_print(ANDROID_LOG_WARN,TAG ,fmt, ##__VA_ARGS__)
#define LOGE(fmt, ...) __android_log_print(ANDROID_LOG_ERROR,TAG ,fmt, ##__VA_ARGS__)
#else
#define Time_Format_Now (::tapsight::getTimeFormatStr().c_str())
#define LOGD(fmt, ...) printf(TAG "[%s] DEBUG[%s][%s][%d]:" fmt "\n", Time_Format_Now, __FILE__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
#define LOGI(fmt, ...) printf(TAG "[%s] :" fmt "\n", Time_Format_Now ,##__VA_ARGS__)
#define LOGW(fmt, ...) printf(TAG "[%s] WARNING:" fmt "\n", Time_Format_Now, ##__VA_ARGS__)
#define LOGE(fmt, ...) printf(TAG "[%s] ERROR:" fmt "\n", Time_Format_Now, ##__VA_ARGS__)
#endif

#if TAPSIGHT_DEBUG_LOG
#define BDLOG(fmt, ...)   LOGD(fmt,##__VA_ARGS__)
#else
#define BDLOG(...)
#endif
#define BDLOGE(fmt, ...)  LOGE(fmt,##__VA_ARGS__)

#define BLOG(fmt, ...)    LOGI(fmt,##__VA_ARGS__)
#define BLOGE(fmt, ...)   LOGE(fmt,##__VA_ARGS__)

// Log a full UI dump or model reply without losing the tail on logcat
inline void logLongStringInfo(const std::string &longStr) {
    const size_t MAX_LOG_LEN = 3000;
    size_t totalLen = longStr.length();
    if (totalLen <= MAX_LOG_LEN) {
        BDLOG("%s", longStr.c_str());
        return;
    }
    size_t pos = 0;
    size_t chunkNum = 0;
    size_t totalChunks = (totalLen + MAX_LOG_LEN - 1) / MAX_LOG_LEN;
    while (pos < totalLen) {
        size_t chunkLen = std::min(MAX_LOG_LEN, totalLen - pos);
        BDLOG("[chunk %zu/%zu] %s", chunkNum + 1, totalChunks, longStr.substr(pos, chunkLen).c_str());
        pos += chunkLen;
        chunkNum++;
    }
}

// Element size window used by repeating list item detection, in device pixels
#define ListItemMinSide       100
#define ListItemMaxWidth      900
#define ListItemMaxHeight     1500
#define ListItemSizeBucket    50
#define ListItemMinCount      2

// Recognized runs below this Tesseract confidence (0-100) are dropped before matching
#define OcrMinRunConfidence   30

// Maximum number of visible texts printed by describeScreen
#define DescribeMaxTexts      10

#define TAPSIGHT_VERSION __DATE__ " " __TIME__

#endif // UTILS_HPP_
