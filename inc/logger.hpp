// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace telegen {

/// Topic being validated/sanitized
struct TopicContext {
    std::string topic;
    std::optional<std::string> sanitized;
    std::optional<std::string> violation;
};

/// Input record being processed
struct RecordContext {
    std::optional<std::size_t> row;
    std::optional<std::string> node_id;
    std::optional<std::string> custom_name;
};

/// Error details for failed operations
struct ErrorContext {
    std::string type;
    std::string message;
};

/**
 * @brief Structured log entry rendered as a JSON object after the message.
 *
 * Usage:
 *   LOG_WARN_ENTRY(LogEntry("Topic sanitized").component("topics").topic({...}));
 */
class LogEntry {
public:
    explicit LogEntry(std::string message) : message_(std::move(message)) {}

    LogEntry& component(std::string value) {
        component_ = std::move(value);
        return *this;
    }

    LogEntry& operation(std::string value) {
        operation_ = std::move(value);
        return *this;
    }

    LogEntry& topic(TopicContext value) {
        topic_ = std::move(value);
        return *this;
    }

    LogEntry& record(RecordContext value) {
        record_ = std::move(value);
        return *this;
    }

    LogEntry& error(ErrorContext value) {
        error_ = std::move(value);
        return *this;
    }

    /**
     * @brief Render as "<message> {json context}" (context omitted when empty).
     */
    [[nodiscard]] std::string render() const;

private:
    std::string message_;
    std::optional<std::string> component_;
    std::optional<std::string> operation_;
    std::optional<TopicContext> topic_;
    std::optional<RecordContext> record_;
    std::optional<ErrorContext> error_;
};

/**
 * @brief Process-wide logger setup on top of spdlog.
 */
class Logger {
public:
    /**
     * @brief Install the stderr logger and set its level.
     *
     * @param level One of trace|debug|info|warn|warning|error
     * @throws std::runtime_error on an unknown level
     */
    static void init(const std::string& level);

    /**
     * @brief Flush and drop all loggers.
     */
    static void shutdown();

    /**
     * @brief Map a configuration level name to the spdlog level.
     * @throws std::runtime_error on an unknown level
     */
    static spdlog::level::level_enum parse_level(std::string_view level);
};

} // namespace telegen

// Format-string logging ({} placeholders)
#define LOG_TRACE(...) ::spdlog::trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::spdlog::debug(__VA_ARGS__)
#define LOG_INFO(...) ::spdlog::info(__VA_ARGS__)
#define LOG_WARN(...) ::spdlog::warn(__VA_ARGS__)
#define LOG_ERROR(...) ::spdlog::error(__VA_ARGS__)

// Structured logging with LogEntry
#define LOG_TRACE_ENTRY(entry) ::spdlog::trace("{}", (entry).render())
#define LOG_DEBUG_ENTRY(entry) ::spdlog::debug("{}", (entry).render())
#define LOG_INFO_ENTRY(entry) ::spdlog::info("{}", (entry).render())
#define LOG_WARN_ENTRY(entry) ::spdlog::warn("{}", (entry).render())
#define LOG_ERROR_ENTRY(entry) ::spdlog::error("{}", (entry).render())
