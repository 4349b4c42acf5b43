// SPDX-License-Identifier: Apache-2.0
// Header-only asynchronous logger.
//  - ARENA_LOG_LEVEL=debug|info|warn|error selects the minimum level (default info)
//  - ARENA_LOG_JSON switches to one JSON object per line
//  - ARENA_LOG_APP_ID prefixes every text line (useful when several servers share a terminal)
// Lines are queued and written to stderr by one background thread started on first use.

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
#include <utility>

namespace arena::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

namespace detail {

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

inline char level_tag(level lv)
{
    switch (lv) {
        case level::debug:
            return 'D';
        case level::info:
            return 'I';
        case level::warn:
            return 'W';
        case level::error:
            return 'E';
    }
    return 'I';
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

inline void json_escape(std::ostream &os, std::string_view m)
{
    for (char c : m) {
        switch (c) {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            case '\t':
                os << "\\t";
                break;
            default:
                os << c;
        }
    }
}

struct Record
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

class Sink
{
public:
    static Sink &instance()
    {
        static Sink inst;
        return inst;
    }

    void configure_from_env()
    {
        if (const char *lvl = std::getenv("ARENA_LOG_LEVEL"))
            m_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
        if (std::getenv("ARENA_LOG_JSON"))
            m_json.store(true, std::memory_order_relaxed);
        if (const char *app = std::getenv("ARENA_LOG_APP_ID"); app && *app)
            set_app_id(app);
    }

    void start()
    {
        std::call_once(m_start_once, [this] {
            m_running.store(true, std::memory_order_release);
            m_thread = std::thread([this] { consume(); });
            std::atexit([] { Sink::instance().stop(); });
        });
    }

    void stop()
    {
        if (!m_running.exchange(false, std::memory_order_acq_rel))
            return;
        m_cv.notify_all();
        if (m_thread.joinable())
            m_thread.join();
    }

    bool enabled(level lv) const noexcept
    {
        return static_cast<int>(lv) >= m_level.load(std::memory_order_relaxed);
    }

    void set_level(level lv) noexcept
    {
        m_level.store(static_cast<int>(lv), std::memory_order_relaxed);
    }

    void set_json(bool on) noexcept
    {
        m_json.store(on, std::memory_order_relaxed);
    }

    void set_app_id(std::string id)
    {
        std::lock_guard lk(m_io_mtx);
        m_app_id = std::move(id);
    }

    void set_callback(void (*cb)(int, const char *, void *), void *ud) noexcept
    {
        std::lock_guard lk(m_io_mtx);
        m_cb = cb;
        m_cb_ud = ud;
    }

    void submit(level lv, std::string msg)
    {
        start();
        auto ts = std::chrono::system_clock::now();
        if (!m_running.load(std::memory_order_acquire)) {
            // after shutdown (static destruction order): write inline
            write_line(Record{lv, std::move(msg), ts});
            return;
        }
        {
            std::lock_guard lk(m_q_mtx);
            m_queue.push_back(Record{lv, std::move(msg), ts});
        }
        m_cv.notify_one();
    }

private:
    Sink()
    {
        configure_from_env();
    }

    void consume()
    {
        while (true) {
            std::deque<Record> batch;
            {
                std::unique_lock lk(m_q_mtx);
                m_cv.wait(lk, [this] { return !m_queue.empty() || !m_running.load(std::memory_order_acquire); });
                batch.swap(m_queue);
            }
            for (auto &r : batch)
                write_line(r);
            if (!m_running.load(std::memory_order_acquire)) {
                std::lock_guard lk(m_q_mtx);
                if (m_queue.empty())
                    break;
            }
        }
    }

    void write_line(const Record &r)
    {
        std::time_t tt = std::chrono::system_clock::to_time_t(r.ts);
        std::tm tm{};
        localtime_r(&tt, &tm);
        std::lock_guard lk(m_io_mtx);
        if (m_json.load(std::memory_order_relaxed)) {
            std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\""
                      << level_name(r.lv) << "\",\"msg\":\"";
            json_escape(std::cerr, r.msg);
            std::cerr << "\"}\n";
        } else {
            if (!m_app_id.empty())
                std::cerr << m_app_id << ' ';
            std::cerr << '[' << level_tag(r.lv) << ' ' << std::put_time(&tm, "%H:%M:%S") << "] " << r.msg << '\n';
        }
        std::cerr.flush();
        if (m_cb)
            m_cb(static_cast<int>(r.lv), r.msg.c_str(), m_cb_ud);
    }

    std::atomic<int> m_level{static_cast<int>(level::info)};
    std::atomic<bool> m_json{false};
    std::atomic<bool> m_running{false};
    std::once_flag m_start_once;
    std::mutex m_q_mtx;
    std::condition_variable m_cv;
    std::deque<Record> m_queue;
    std::mutex m_io_mtx; // guards stderr, app id and callback
    std::string m_app_id;
    void (*m_cb)(int, const char *, void *){nullptr};
    void *m_cb_ud{nullptr};
    std::thread m_thread;
};

} // namespace detail

namespace fmt_detail {

template <typename T>
inline std::string to_text(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string("(null)");
    else if constexpr (std::is_convertible_v<const T &, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<D>)
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
        size_t next = 0;
        while (next < values.size()) {
            size_t p = fmt.find("{}", pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(pos, p - pos));
            out += values[next++];
            pos = p + 2;
        }
        out.append(fmt.substr(pos));
        for (; next < values.size(); ++next) {
            out.push_back(' ');
            out += values[next];
        }
        return out;
    }
}

} // namespace fmt_detail

// Re-reads the ARENA_LOG_* environment (main may export config values first) and starts the writer.
inline void init()
{
    detail::Sink::instance().configure_from_env();
    detail::Sink::instance().start();
}

inline void shutdown()
{
    detail::Sink::instance().stop();
}

inline bool enabled(level lv) noexcept
{
    return detail::Sink::instance().enabled(lv);
}

inline void set_level(level lv) noexcept
{
    detail::Sink::instance().set_level(lv);
}

inline void set_app_id(std::string id)
{
    detail::Sink::instance().set_app_id(std::move(id));
}

inline void set_callback(void (*cb)(int, const char *, void *), void *ud) noexcept
{
    detail::Sink::instance().set_callback(cb, ud);
}

template <typename... Args>
inline void write(level lv, std::string_view fmt, const Args &...args)
{
    if (!enabled(lv))
        return;
    detail::Sink::instance().submit(lv, fmt_detail::format(fmt, args...));
}

template <typename... Args>
inline void debug(std::string_view fmt, const Args &...args)
{
    write(level::debug, fmt, args...);
}

template <typename... Args>
inline void info(std::string_view fmt, const Args &...args)
{
    write(level::info, fmt, args...);
}

template <typename... Args>
inline void warn(std::string_view fmt, const Args &...args)
{
    write(level::warn, fmt, args...);
}

template <typename... Args>
inline void error(std::string_view fmt, const Args &...args)
{
    write(level::error, fmt, args...);
}

} // namespace arena::log
