#pragma once

#include "stencil/core/logger.hpp"
#include <gtest/gtest.h>
#include <string_view>

namespace stencil::testing {

// Routes all log records into a MemorySink for the duration of a test
class LogCaptureTest : public ::testing::Test {
protected:
    void SetUp() override {
        logging::shutdown();
        auto sink = std::make_unique<MemorySink>();
        m_sink = sink.get();
        std::vector<std::unique_ptr<LogSink>> sinks;
        sinks.push_back(std::move(sink));
        logging::init(std::move(sinks));
        m_previous_level = logging::level();
        logging::set_level(LogLevel::Trace);
    }

    void TearDown() override {
        logging::set_level(m_previous_level);
        logging::shutdown();
        m_sink = nullptr;
    }

    [[nodiscard]] const std::vector<MemorySink::Entry>& records() const { return m_sink->entries(); }

    [[nodiscard]] usize count(LogLevel level, std::string_view logger_name) const {
        usize result = 0;
        for (const auto& entry : m_sink->entries()) {
            if (entry.level == level && entry.logger_name == logger_name) {
                ++result;
            }
        }
        return result;
    }

    [[nodiscard]] bool logged(std::string_view fragment) const {
        for (const auto& entry : m_sink->entries()) {
            if (entry.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    MemorySink* m_sink{nullptr};
    LogLevel m_previous_level{LogLevel::Info};
};

} // namespace stencil::testing
