// SPDX-FileCopyrightText: Copyright 2026 zoneinfo Project
// SPDX-License-Identifier: GPL-2.0-or-later

#include <atomic>
#include <chrono>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/os.h>

#ifdef _WIN32
#include <io.h>
#define ZONEINFO_ISATTY(fd) _isatty(fd)
#define ZONEINFO_FILENO(file) _fileno(file)
#else
#include <unistd.h>
#define ZONEINFO_ISATTY(fd) isatty(fd)
#define ZONEINFO_FILENO(file) fileno(file)
#endif

#include "common/logging/backend.h"
#include "common/logging/log.h"
#include "common/logging/log_entry.h"
#include "common/logging/text_formatter.h"
#include "common/settings.h"

namespace Common::Log {

namespace {

/// Destination for formatted log entries.
class Backend {
public:
    virtual ~Backend() = default;
    virtual void Write(const Entry& entry) = 0;
    virtual void Flush() = 0;
};

/// Writes to stderr, colored when stderr is a terminal.
class ConsoleBackend final : public Backend {
public:
    ConsoleBackend() : colored{ZONEINFO_ISATTY(ZONEINFO_FILENO(stderr)) != 0} {}

    void Write(const Entry& entry) override {
        PrintMessage(entry, colored);
    }

    void Flush() override {
        std::fflush(stderr);
    }

private:
    const bool colored;
};

/// Appends to a file, giving up once MaxLogFileSize bytes have been written.
class FileBackend final : public Backend {
public:
    explicit FileBackend(const std::string& filename) {
        try {
            file.emplace(fmt::output_file(filename));
        } catch (const std::system_error& e) {
            fmt::print(stderr, "Unable to open log file {}: {}\n", filename, e.what());
        }
    }

    void Write(const Entry& entry) override {
        if (!file || bytes_written > MaxLogFileSize) {
            return;
        }

        const auto message = FormatLogMessage(entry);
        file->print("{}\n", message);
        bytes_written += message.size() + 1;

        if (entry.log_level >= Level::Error || bytes_written > MaxLogFileSize) {
            file->flush();
        }
    }

    void Flush() override {
        if (file) {
            file->flush();
        }
    }

private:
    static constexpr std::size_t MaxLogFileSize = 100 * 1024 * 1024;

    std::optional<fmt::ostream> file;
    std::size_t bytes_written = 0;
};

std::atomic_bool suppress_logging{true};

/// Process-wide logger state, created by Initialize.
class Logger {
public:
    Logger(const Filter& filter_, const std::string& log_file) : filter{filter_} {
        backends.push_back(std::make_unique<ConsoleBackend>());
        if (!log_file.empty()) {
            backends.push_back(std::make_unique<FileBackend>(log_file));
        }
    }

    void Push(Class log_class, Level log_level, const char* filename, unsigned int line_num,
              const char* function, std::string&& message) {
        std::scoped_lock lock{mutex};
        if (!filter.CheckMessage(log_class, log_level)) {
            return;
        }

        const Entry entry{
            .timestamp = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - time_origin),
            .log_class = log_class,
            .log_level = log_level,
            .filename = filename,
            .line_num = line_num,
            .function = function,
            .message = std::move(message),
        };
        for (const auto& backend : backends) {
            backend->Write(entry);
        }
    }

    void Flush() {
        std::scoped_lock lock{mutex};
        for (const auto& backend : backends) {
            backend->Flush();
        }
    }

private:
    std::mutex mutex;
    Filter filter;
    std::vector<std::unique_ptr<Backend>> backends;
    const std::chrono::steady_clock::time_point time_origin{std::chrono::steady_clock::now()};
};

std::unique_ptr<Logger> logger;

} // Anonymous namespace

void Initialize() {
    if (logger) {
        LOG_WARNING(Log, "Logging is already initialized");
        return;
    }

    Filter filter;
    filter.ParseFilterString(Settings::values.log_filter.GetValue());
    logger = std::make_unique<Logger>(filter, Settings::values.log_file.GetValue());
    suppress_logging = false;
}

void Stop() {
    if (logger) {
        logger->Flush();
    }
}

void DisableLoggingInTests() {
    suppress_logging = true;
}

void FmtLogMessageImpl(Class log_class, Level log_level, const char* filename,
                       unsigned int line_num, const char* function, fmt::string_view format,
                       const fmt::format_args& args) {
    if (suppress_logging || !logger) {
        return;
    }
    logger->Push(log_class, log_level, filename, line_num, function, fmt::vformat(format, args));
}

} // namespace Common::Log
