#pragma once

#include <cstdarg>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace floatwm {

    // Process-wide log sink. Messages are queued without blocking and handed to the
    // registered callbacks (and optionally stderr) on a shared processing thread.
    class Logger {
    public:
        class Impl;

#undef ERROR
        enum LogLevel {
            DIAGNOSTIC,
            INFO,
            WARNING,
            ERROR,
            SILENT
        };

        using Callback = std::function<void(LogLevel level, size_t serial, const char* s)>;

        // The global logger echoes INFO and above to stderr.
        static Logger* global();
        void logError(const char* format, ...);
        void logWarning(const char* format, ...);
        void logInfo(const char* format, ...);
        void logDiagnostic(const char* format, ...);
        void logv(LogLevel level, const char* format, va_list args);
        static void stopDefaultLogger();

        explicit Logger(LogLevel stderrLevel = SILENT);
        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        // Callbacks run on the processing thread and must not add or remove callbacks.
        int32_t addCallback(Callback callback);
        void removeCallback(int32_t token);

        // Messages below `level` are not echoed to stderr; SILENT turns the echo off.
        void stderrLevel(LogLevel level);
        LogLevel stderrLevel() const;

    private:
        Impl *impl{nullptr};
    };

    struct Point {
        double x{0};
        double y{0};
    };

    struct Size {
        double width{0};
        double height{0};
    };

    struct Rect {
        double x{0};
        double y{0};
        double width{0};
        double height{0};

        double left() const { return x; }
        double top() const { return y; }
        double right() const { return x + width; }
        double bottom() const { return y + height; }
        bool contains(double px, double py) const {
            return px >= x && px < x + width && py >= y && py < y + height;
        }
    };

}
