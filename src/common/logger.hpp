// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// A single background thread drains a queue of formatted lines so the tick
// loop never blocks on stderr. Provides:
//  - Level filtering via ASTRO_LOG_LEVEL (debug|info|warn|error)
//  - JSON lines via ASTRO_LOG_JSON presence
//  - Optional app id prefix via ASTRO_LOG_APP_ID
//  - Optional external callback (set_callback), used by tests to capture output

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace astro::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

namespace detail {

struct line
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

using callback_fn = void (*)(int, const char *, void *);

// All mutable logger state lives in one place so start/stop ordering is obvious.
struct sink
{
    std::atomic<int> min_level{static_cast<int>(level::info)};
    std::atomic<bool> json{false};
    std::atomic<bool> started{false};
    std::atomic<bool> running{false};
    std::atomic<callback_fn> cb{nullptr};
    std::atomic<void *> cb_ud{nullptr};
    std::string app_id; // guarded by io_mtx
    std::mutex io_mtx;
    std::mutex q_mtx;
    std::condition_variable q_cv;
    std::deque<line> queue;
    std::thread worker;
};

inline sink &state()
{
    static sink s;
    return s;
}

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline level parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "debug" || v == "trace")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

template <typename T>
inline std::string to_text(const T &v)
{
    if constexpr (std::is_same_v<std::decay_t<T>, std::string>)
        return v;
    else if constexpr (std::is_same_v<std::decay_t<T>, const char *> || std::is_same_v<std::decay_t<T>, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<std::decay_t<T>, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_floating_point_v<T>) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed, std::ios::floatfield);
        oss.precision(3);
        oss << v;
        return oss.str();
    } else if constexpr (std::is_enum_v<T>)
        return std::to_string(static_cast<long long>(v));
    else if constexpr (std::is_arithmetic_v<T>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// Replaces each "{}" with the next argument; surplus arguments are appended space separated.
template <typename... Args>
inline std::string format(std::string_view fmt, const Args &...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        std::array<std::string, sizeof...(Args)> values{to_text(args)...};
        std::string out;
        out.reserve(fmt.size() + values.size() * 8);
        size_t pos = 0;
        size_t idx = 0;
        while (idx < values.size()) {
            size_t p = fmt.find("{}", pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(pos, p - pos));
            out += values[idx++];
            pos = p + 2;
        }
        out.append(fmt.substr(pos));
        for (; idx < values.size(); ++idx) {
            out.push_back(' ');
            out += values[idx];
        }
        return out;
    }
}

inline void emit(const line &ln)
{
    auto &s = state();
    std::time_t tt = std::chrono::system_clock::to_time_t(ln.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    {
        std::lock_guard lk(s.io_mtx);
        if (s.json.load(std::memory_order_relaxed)) {
            std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                      << level_name(ln.lv) << "\",\"msg\":\"";
            for (char c : ln.msg) {
                if (c == '"' || c == '\\')
                    std::cerr << '\\';
                std::cerr << c;
            }
            std::cerr << "\"}\n";
        } else {
            char buf[16];
            std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
            const char *tag = ln.lv == level::debug ? "D"
                : ln.lv == level::info              ? "I"
                : ln.lv == level::warn              ? "W"
                                                    : "E";
            if (!s.app_id.empty())
                std::cerr << s.app_id << ' ';
            std::cerr << '[' << tag << ' ' << buf << "] " << ln.msg << '\n';
        }
        std::cerr.flush();
    }
    if (auto cb = s.cb.load(std::memory_order_acquire))
        cb(static_cast<int>(ln.lv), ln.msg.c_str(), s.cb_ud.load(std::memory_order_relaxed));
}

inline void drain_loop()
{
    auto &s = state();
    for (;;) {
        std::deque<line> batch;
        {
            std::unique_lock lk(s.q_mtx);
            s.q_cv.wait(lk, [&] { return !s.running.load(std::memory_order_acquire) || !s.queue.empty(); });
            if (s.queue.empty() && !s.running.load(std::memory_order_acquire))
                return;
            batch.swap(s.queue);
        }
        for (auto &ln : batch)
            emit(ln);
    }
}

inline void stop()
{
    auto &s = state();
    if (!s.running.exchange(false, std::memory_order_acq_rel))
        return;
    s.q_cv.notify_all();
    if (s.worker.joinable())
        s.worker.join();
}

inline void start()
{
    auto &s = state();
    if (s.started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("ASTRO_LOG_LEVEL"))
        s.min_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("ASTRO_LOG_JSON"))
        s.json.store(true, std::memory_order_relaxed);
    if (const char *app = std::getenv("ASTRO_LOG_APP_ID")) {
        std::lock_guard lk(s.io_mtx);
        s.app_id.assign(app);
    }
    s.running.store(true, std::memory_order_release);
    s.worker = std::thread([] { drain_loop(); });
    std::atexit([] { stop(); });
}

} // namespace detail

inline void init()
{
    detail::start();
}

// Flushes pending lines and joins the background thread.
inline void shutdown()
{
    detail::stop();
}

inline void set_level(level lv) noexcept
{
    detail::state().min_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_app_id(std::string id)
{
    auto &s = detail::state();
    std::lock_guard lk(s.io_mtx);
    s.app_id = std::move(id);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::state().min_level.load(std::memory_order_relaxed);
}

inline void set_callback(void (*cb)(int, const char *, void *), void *ud) noexcept
{
    auto &s = detail::state();
    s.cb_ud.store(ud, std::memory_order_release);
    s.cb.store(cb, std::memory_order_release);
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    auto &s = detail::state();
    detail::line ln{lv, std::string(msg), std::chrono::system_clock::now()};
    if (s.running.load(std::memory_order_acquire)) {
        {
            std::lock_guard lk(s.q_mtx);
            s.queue.push_back(std::move(ln));
        }
        s.q_cv.notify_one();
    } else {
        detail::emit(ln);
    }
}

template <typename... Args>
inline void debug(const char *fmt, const Args &...args)
{
    if (enabled(level::debug))
        write(level::debug, detail::format(fmt, args...));
}

template <typename... Args>
inline void info(const char *fmt, const Args &...args)
{
    if (enabled(level::info))
        write(level::info, detail::format(fmt, args...));
}

template <typename... Args>
inline void warn(const char *fmt, const Args &...args)
{
    if (enabled(level::warn))
        write(level::warn, detail::format(fmt, args...));
}

template <typename... Args>
inline void error(const char *fmt, const Args &...args)
{
    if (enabled(level::error))
        write(level::error, detail::format(fmt, args...));
}

} // namespace astro::log
