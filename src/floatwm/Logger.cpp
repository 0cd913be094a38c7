#include <array>
#include <atomic>
#include <iostream>
#include <mutex>
#include <unordered_set>
#include <utility>
#include <floatwm/floatwm.hpp>
#include <rtlog/rtlog.h>

namespace floatwm {

    namespace {
        constexpr auto MAX_QUEUED_MESSAGES = 512;
        constexpr auto MAX_MESSAGE_LENGTH = 1024;

        std::atomic<std::size_t> message_serial{0};

        struct MessageContext {
            Logger::LogLevel level;
            Logger::Impl* target;
        };

        using MessageQueue = rtlog::Logger<MessageContext, MAX_QUEUED_MESSAGES, MAX_MESSAGE_LENGTH,
                                           message_serial, rtlog::MultiRealtimeWriterQueueType>;
        MessageQueue message_queue;

        // Loggers that may still receive queued messages. Guarded by liveLoggersMutex().
        std::mutex& liveLoggersMutex() {
            static std::mutex mutex;
            return mutex;
        }

        std::unordered_set<Logger::Impl*>& liveLoggers() {
            static std::unordered_set<Logger::Impl*> loggers;
            return loggers;
        }

        const char* levelString(Logger::LogLevel level) {
            switch (level) {
                case Logger::DIAGNOSTIC: return "D";
                case Logger::INFO: return "I";
                case Logger::WARNING: return "W";
                case Logger::ERROR: return "E";
                case Logger::SILENT: break;
            }
            return "";
        }

        class MessageDispatcher {
        public:
            MessageDispatcher() = default;
            MessageDispatcher(const MessageDispatcher&) = delete;
            MessageDispatcher& operator=(const MessageDispatcher&) = delete;

#if defined(_MSC_VER)
            void operator()(const MessageContext& context, size_t serial, const char* format, ...);
#else
            void operator()(const MessageContext& context, size_t serial, const char* format, ...) __attribute__ ((format (printf, 4, 5)));
#endif
        };

        MessageDispatcher dispatcher;

        rtlog::LogProcessingThread<MessageQueue, MessageDispatcher>* processingThread() {
            static rtlog::LogProcessingThread thread(message_queue, dispatcher, std::chrono::milliseconds(10));
            return &thread;
        }
    }

    class Logger::Impl {
        std::atomic<LogLevel> stderr_level_;
        std::mutex callbacks_mutex_;
        std::vector<std::pair<int32_t, Callback>> callbacks_;
        int32_t next_token_{1};

    public:
        explicit Impl(LogLevel stderrLevel) : stderr_level_(stderrLevel) {}

        LogLevel stderrLevel() const { return stderr_level_.load(); }
        void stderrLevel(LogLevel level) { stderr_level_.store(level); }

        int32_t addCallback(Callback callback) {
            std::lock_guard lock{callbacks_mutex_};
            auto token = next_token_++;
            callbacks_.emplace_back(token, std::move(callback));
            return token;
        }

        void removeCallback(int32_t token) {
            std::lock_guard lock{callbacks_mutex_};
            std::erase_if(callbacks_, [token](const auto& entry) { return entry.first == token; });
        }

        // Runs on the processing thread; the stderr echo is written before any callback runs.
        void deliver(LogLevel level, size_t serial, const char* message) {
            if (level >= stderr_level_.load())
                std::cerr << "[floatwm #" << serial << " (" << levelString(level) << ")]: " << message << std::endl;
            std::lock_guard lock{callbacks_mutex_};
            for (auto& [token, callback] : callbacks_)
                callback(level, serial, message);
        }
    };

    void MessageDispatcher::operator()(const MessageContext& context, size_t serial, const char* format, ...) {
        std::array<char, MAX_MESSAGE_LENGTH> buffer;
        va_list args;
        va_start(args, format);
        vsnprintf(buffer.data(), buffer.size(), format, args);
        va_end(args);

        std::lock_guard lock{liveLoggersMutex()};
        // the logger was destroyed while its message sat in the queue
        if (!liveLoggers().contains(context.target))
            return;
        context.target->deliver(context.level, serial, buffer.data());
    }

    Logger::Logger(LogLevel stderrLevel) {
        impl = new Impl(stderrLevel);
        {
            std::lock_guard lock{liveLoggersMutex()};
            liveLoggers().insert(impl);
        }
        processingThread();
    }

    Logger::~Logger() {
        {
            std::lock_guard lock{liveLoggersMutex()};
            liveLoggers().erase(impl);
        }
        delete impl;
    }

    int32_t Logger::addCallback(Callback callback) {
        return impl->addCallback(std::move(callback));
    }

    void Logger::removeCallback(int32_t token) {
        impl->removeCallback(token);
    }

    void Logger::stderrLevel(LogLevel level) {
        impl->stderrLevel(level);
    }

    Logger::LogLevel Logger::stderrLevel() const {
        return impl->stderrLevel();
    }

    void Logger::logv(LogLevel level, const char *format, va_list args) {
        if (level == SILENT)
            return;
        message_queue.Logv(MessageContext{.level = level, .target = impl}, format, args);
    }

    void Logger::stopDefaultLogger() {
        processingThread()->Stop();
    }

#define FLOATWM_DEFINE_LOG_FUNCTION(LEVEL, NAME) \
    void Logger::log##NAME(const char *format, ...) { \
        va_list args; \
        va_start(args, format); \
        logv(LEVEL, format, args); \
        va_end(args); \
    }

    FLOATWM_DEFINE_LOG_FUNCTION(ERROR, Error)
    FLOATWM_DEFINE_LOG_FUNCTION(WARNING, Warning)
    FLOATWM_DEFINE_LOG_FUNCTION(INFO, Info)
    FLOATWM_DEFINE_LOG_FUNCTION(DIAGNOSTIC, Diagnostic)

#undef FLOATWM_DEFINE_LOG_FUNCTION

    Logger* Logger::global() {
        static Logger instance{INFO};
        return &instance;
    }

}
