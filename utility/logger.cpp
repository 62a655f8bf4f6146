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

#include "logger.h"
#include "helpers.h"
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <stdexcept>
#include <mutex>
#include <stdio.h>

namespace wasmverify {

Logger* Logger::g_logger = nullptr;

namespace {

class ConsoleLogger : public Logger {
public:
    ConsoleLogger(int flushLevel, int minLevel) :
        _minLevel(minLevel),
        _flushLevel(flushLevel)
    {
        if (minLevel < LOG_LEVEL_VERBOSE || minLevel > LOG_LEVEL_CRITICAL)
            throw std::runtime_error("logger: minimal level out of range");
    }

    ~ConsoleLogger() override {
        if (this == g_logger)
            g_logger = nullptr;
    }

protected:
    bool level_accepted(int level) const override {
        return level >= _minLevel;
    }

    void write_message(int level, uint64_t timestamp, const std::string& msg) override {
        char header[64];
        size_t n = format_timestamp(header + 2, sizeof(header) - 3, "%Y-%m-%d.%T", timestamp);
        header[0] = loglevel_tag(level);
        header[1] = ' ';
        header[n + 2] = ' ';

        std::lock_guard<std::mutex> lock(_mutex);
        fwrite(header, 1, n + 3, stdout);
        fwrite(msg.data(), 1, msg.size(), stdout);
        if (level >= _flushLevel)
            fflush(stdout);
    }

private:
    std::mutex _mutex;
    int _minLevel;
    int _flushLevel;
};

constexpr size_t MAX_MSG_SIZE = 10000;

// per-thread message buffer, reused between messages
struct LogThreadContext {
    using Formatter = boost::iostreams::filtering_ostream;

    std::string msgBuffer;
    std::unique_ptr<Formatter> formatter;

    LogThreadContext() {
        reset();
    }

    void reset() {
        msgBuffer = std::string();
        msgBuffer.reserve(MAX_MSG_SIZE);
        formatter = std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer));
    }
};

LogThreadContext& get_context() {
    static thread_local LogThreadContext ctx;
    return ctx;
}

} //namespace

std::shared_ptr<Logger> Logger::create(int flushLevel, int minLevel) {
    if (g_logger)
        throw std::runtime_error("logger already initialized");

    auto logger = std::make_shared<ConsoleLogger>(flushLevel, minLevel);
    g_logger = logger.get();
    return logger;
}

LogMessage::LogMessage(int level) :
    _level(level),
    _timestamp(local_timestamp_msec()),
    _formatter(get_context().formatter.get())
{}

LogMessage::~LogMessage() {
    if (!Logger::g_logger)
        return;

    auto& ctx = get_context();
    *_formatter << '\n';
    _formatter->flush();
    Logger::g_logger->write_message(_level, _timestamp, ctx.msgBuffer);

    if (ctx.msgBuffer.size() > MAX_MSG_SIZE)
        ctx.reset();
    else
        ctx.msgBuffer.clear();
}

} //namespace
