// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <stdint.h>

#ifndef LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE_ENABLED 0
#endif

#ifndef LOG_DEBUG_ENABLED
    #ifndef NDEBUG
        #define LOG_DEBUG_ENABLED 1
    #else
        #define LOG_DEBUG_ENABLED 0
    #endif
#endif

// API

#define LOG_LEVEL_CRITICAL 6
#define LOG_LEVEL_ERROR    5
#define LOG_LEVEL_WARNING  4
#define LOG_LEVEL_INFO     3
#define LOG_LEVEL_DEBUG    2
#define LOG_LEVEL_VERBOSE  1

// Swallows everything, optimized out
struct LogMessageStub {
    template <typename T> LogMessageStub& operator<<(const T&) { return *this; }
};

#define LOG_MESSAGE(LEVEL) if (wasmverify::Logger::will_log(LEVEL)) wasmverify::LogMessage(LEVEL)

#define LOG_CRITICAL() LOG_MESSAGE(LOG_LEVEL_CRITICAL)
#define LOG_ERROR() LOG_MESSAGE(LOG_LEVEL_ERROR)
#define LOG_WARNING() LOG_MESSAGE(LOG_LEVEL_WARNING)
#define LOG_INFO() LOG_MESSAGE(LOG_LEVEL_INFO)

#if LOG_DEBUG_ENABLED
    #define LOG_DEBUG() LOG_MESSAGE(LOG_LEVEL_DEBUG)
#else
    #define LOG_DEBUG() LogMessageStub()
#endif

#if LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE() LOG_MESSAGE(LOG_LEVEL_VERBOSE)
#else
    #define LOG_VERBOSE() LogMessageStub()
#endif

namespace wasmverify {

/// Level tag printed in front of each line
inline char loglevel_tag(int level) {
    static const char logTags[] = "~VDIWEC";
    if (level < 0 || level >= int(sizeof(logTags)) - 1) level = 0;
    return logTags[level];
}

/// Process-wide console logger, one instance at a time
class Logger {
public:
    /// RAII, the returned owner uninstalls the logger when released.
    /// Messages below minLevel are dropped, stdout is flushed after messages at flushLevel and above.
    static std::shared_ptr<Logger> create(int flushLevel = LOG_LEVEL_WARNING, int minLevel = LOG_LEVEL_INFO);

    virtual ~Logger() {}

    static bool will_log(int level) {
        return g_logger && g_logger->level_accepted(level);
    }

protected:
    friend class LogMessage;

    virtual bool level_accepted(int level) const = 0;

    /// Called from LogMessage dtor on message completed
    virtual void write_message(int level, uint64_t timestamp, const std::string& msg) = 0;

    static Logger* g_logger;
};

// Log message, supports operator<< and writes itself in destructor
class LogMessage {
public:
    explicit LogMessage(int level);

    template <class T> LogMessage& operator<<(const T& x) {
        *_formatter << x;
        return *this;
    }

    ~LogMessage();

private:
    int _level;
    uint64_t _timestamp;
    std::ostream* _formatter = nullptr;
};

} //namespace
