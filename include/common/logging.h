#pragma once

// ChampView logging
//
// LOG_<LEVEL>(MOD_<MODULE>, "fmt {}", args...) writes one timestamped line
// when the module's effective level allows it. Levels are global with
// optional per-module overrides, set from the command line
// (--log-level=, --log-module=), a JSON "logging" section or SIGUSR1/2.
// Without CVW_DEBUG only FATAL and ERROR are compiled in.

#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <strings.h>
#include <fmt/format.h>

// =============================================================================
// Levels and modules
// =============================================================================
// Setting a level enables it and every level with a lower value. FATAL and
// ERROR are written even at NONE unless a module override is lower still.

enum LogLevel {
    LOG_NONE  = 0,
    LOG_FATAL = 1,
    LOG_ERROR = 2,
    LOG_WARN  = 3,
    LOG_INFO  = 4,
    LOG_DEBUG = 5,
    LOG_TRACE = 6
};

enum LogModule {
    MOD_NET = 0,        // event loop, sockets
    MOD_HTTP,           // curl transfers
    MOD_PROBE,          // HEAD existence checks
    MOD_RESOLVE,        // per-axis state machines
    MOD_ART,            // splash/loading art chain
    MOD_MODEL,          // normalizer
    MOD_VARIANT,        // orchestrator
    MOD_GRAPHICS,
    MOD_INPUT,
    MOD_CONFIG,
    MOD_MAIN,
    MOD_COUNT
};

namespace CVW {
namespace LogDetail {

inline constexpr std::array<const char*, MOD_COUNT> kModuleNames = {
    "NET", "HTTP", "PROBE", "RESOLVE", "ART", "MODEL",
    "VARIANT", "GRAPHICS", "INPUT", "CONFIG", "MAIN"
};

// Fixed width so columns line up
inline constexpr std::array<const char*, LOG_TRACE + 1> kLevelNames = {
    "NONE ", "FATAL", "ERROR", "WARN ", "INFO ", "DEBUG", "TRACE"
};

inline bool ValidModule(LogModule mod) { return mod >= 0 && mod < MOD_COUNT; }

} // namespace LogDetail
} // namespace CVW

inline const char* GetModuleName(LogModule mod) {
    return CVW::LogDetail::ValidModule(mod) ? CVW::LogDetail::kModuleNames[mod] : "UNKNOWN";
}

// Case-insensitive; unknown names map to MOD_MAIN
inline LogModule ParseModuleName(const char* name) {
    for (int i = 0; i < MOD_COUNT; ++i) {
        if (strcasecmp(name, CVW::LogDetail::kModuleNames[i]) == 0) {
            return static_cast<LogModule>(i);
        }
    }
    return MOD_MAIN;
}

inline const char* GetLevelName(LogLevel level) {
    if (level < LOG_NONE || level > LOG_TRACE) {
        return "?????";
    }
    return CVW::LogDetail::kLevelNames[level];
}

// Case-insensitive; OFF is NONE, WARNING is WARN, unknown names are NONE
inline LogLevel ParseLevelName(const char* name) {
    if (strcasecmp(name, "OFF") == 0) return LOG_NONE;
    if (strcasecmp(name, "WARNING") == 0) return LOG_WARN;
    for (int i = LOG_NONE; i <= LOG_TRACE; ++i) {
        std::string_view padded(CVW::LogDetail::kLevelNames[i]);
        std::string_view bare = padded.substr(0, padded.find(' '));
        if (bare.size() == std::strlen(name) && strncasecmp(name, bare.data(), bare.size()) == 0) {
            return static_cast<LogLevel>(i);
        }
    }
    return LOG_NONE;
}

// =============================================================================
// LogManager
// =============================================================================

class LogManager {
public:
    // Receives every line that passes the level check, already formatted
    // without timestamp. Replaces console output while set.
    using Sink = std::function<void(LogModule, LogLevel, const std::string&)>;

    static LogManager& Instance() {
        static LogManager instance;
        return instance;
    }

    int GetGlobalLevel() const { return m_global_level; }
    void SetGlobalLevel(int level) { m_global_level = level; }

    // -1: follow the global level
    int GetModuleLevel(LogModule mod) const {
        return CVW::LogDetail::ValidModule(mod) ? m_module_levels[mod] : -1;
    }

    void SetModuleLevel(LogModule mod, int level) {
        if (CVW::LogDetail::ValidModule(mod)) {
            m_module_levels[mod] = level;
        }
    }

    bool ShouldLog(LogModule mod, LogLevel level) const {
        const int override_level = GetModuleLevel(mod);
        if (level <= LOG_ERROR) {
            return override_level < 0 || level <= override_level;
        }
        const int effective = override_level >= 0 ? override_level : m_global_level;
        return level <= effective;
    }

    void IncreaseLevel() {
        if (m_global_level < LOG_TRACE) {
            ++m_global_level;
        }
    }

    void DecreaseLevel() {
        if (m_global_level > LOG_NONE) {
            --m_global_level;
        }
    }

    void SetSink(Sink sink) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sink = std::move(sink);
    }

    void Write(LogModule mod, LogLevel level, const std::string& message);

private:
    LogManager() { m_module_levels.fill(-1); }

    int m_global_level = LOG_NONE;
    std::array<int, MOD_COUNT> m_module_levels;
    std::mutex m_mutex;
    Sink m_sink;
};

inline int GetLogLevel() { return LogManager::Instance().GetGlobalLevel(); }
inline void SetLogLevel(int level) { LogManager::Instance().SetGlobalLevel(level); }
inline void SetModuleLogLevel(LogModule mod, int level) { LogManager::Instance().SetModuleLevel(mod, level); }
inline bool ShouldLog(LogModule mod, LogLevel level) { return LogManager::Instance().ShouldLog(mod, level); }

// "YYYY-MM-DD HH:MM:SS.mmm" in local time
inline void FormatTimestamp(char* buffer, size_t size) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&secs, &local);
    snprintf(buffer, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
             local.tm_hour, local.tm_min, local.tm_sec, static_cast<int>(ms.count()));
}

inline void LogManager::Write(LogModule mod, LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_sink) {
        m_sink(mod, level, message);
        return;
    }

    char ts[32];
    FormatTimestamp(ts, sizeof(ts));
    std::ostream& out = level <= LOG_ERROR ? std::cerr : std::cout;
    out << "[" << ts << "] [" << GetLevelName(level) << "] [" << GetModuleName(mod) << "] "
        << message << std::endl;
}

// =============================================================================
// Macros
// =============================================================================
// A bad format string is reported in place of the message instead of
// escaping from the call site.

#define CVW_LOG_IMPL(module, level, ...) \
    do { \
        if (ShouldLog(module, level)) { \
            std::string _cvw_msg; \
            try { \
                _cvw_msg = fmt::format(__VA_ARGS__); \
            } catch (const fmt::format_error& _cvw_err) { \
                _cvw_msg = std::string("(format error: ") + _cvw_err.what() + ")"; \
            } \
            LogManager::Instance().Write(module, level, _cvw_msg); \
        } \
    } while (0)

#define LOG_FATAL(module, ...) CVW_LOG_IMPL(module, LOG_FATAL, __VA_ARGS__)
#define LOG_ERROR(module, ...) CVW_LOG_IMPL(module, LOG_ERROR, __VA_ARGS__)

#ifdef CVW_DEBUG
#define LOG_WARN(module, ...)  CVW_LOG_IMPL(module, LOG_WARN, __VA_ARGS__)
#define LOG_INFO(module, ...)  CVW_LOG_IMPL(module, LOG_INFO, __VA_ARGS__)
#define LOG_DEBUG(module, ...) CVW_LOG_IMPL(module, LOG_DEBUG, __VA_ARGS__)
#define LOG_TRACE(module, ...) CVW_LOG_IMPL(module, LOG_TRACE, __VA_ARGS__)
#else
#define LOG_WARN(module, ...)  ((void)0)
#define LOG_INFO(module, ...)  ((void)0)
#define LOG_DEBUG(module, ...) ((void)0)
#define LOG_TRACE(module, ...) ((void)0)
#endif

// =============================================================================
// Runtime control
// =============================================================================
//   signal(SIGUSR1, [](int) { LogLevelIncrease(); });
//   signal(SIGUSR2, [](int) { LogLevelDecrease(); });

inline void LogLevelIncrease() { LogManager::Instance().IncreaseLevel(); }
inline void LogLevelDecrease() { LogManager::Instance().DecreaseLevel(); }

// --log-level=LEVEL and --log-module=MODULE:LEVEL; other arguments are left
// for the caller.
inline void InitLogging(int argc, char* argv[]) {
    constexpr std::string_view kLevelFlag = "--log-level=";
    constexpr std::string_view kModuleFlag = "--log-module=";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg.compare(0, kLevelFlag.size(), kLevelFlag) == 0) {
            SetLogLevel(ParseLevelName(std::string(arg.substr(kLevelFlag.size())).c_str()));
        } else if (arg.compare(0, kModuleFlag.size(), kModuleFlag) == 0) {
            std::string_view value = arg.substr(kModuleFlag.size());
            const size_t colon = value.find(':');
            if (colon == std::string_view::npos || colon == 0) {
                continue;
            }
            const std::string module(value.substr(0, colon));
            const std::string level(value.substr(colon + 1));
            SetModuleLogLevel(ParseModuleName(module.c_str()), ParseLevelName(level.c_str()));
        }
    }
}

// Include <json/json.h> before this header to get InitLoggingFromJson:
//   "logging": { "level": "DEBUG", "modules": { "PROBE": "TRACE" } }
// Non-string values are ignored.
#ifdef JSONCPP_VERSION_STRING
inline void InitLoggingFromJson(const Json::Value& config) {
    if (!config.isObject() || !config.isMember("logging")) {
        return;
    }
    const Json::Value& logging = config["logging"];

    if (logging["level"].isString()) {
        SetLogLevel(ParseLevelName(logging["level"].asCString()));
    }

    const Json::Value& modules = logging["modules"];
    if (!modules.isObject()) {
        return;
    }
    for (const auto& name : modules.getMemberNames()) {
        if (modules[name].isString()) {
            SetModuleLogLevel(ParseModuleName(name.c_str()), ParseLevelName(modules[name].asCString()));
        }
    }
}
#endif
