/**
 * @file logging.hxx
 * @brief Asynchronous logging system with buffering and overflow strategies.
 */

#ifndef NSREDIS_SHARED_LOGGING_HXX
#define NSREDIS_SHARED_LOGGING_HXX

#include <deque>

namespace nsredis::shared {
    /**
     * @brief Log severity levels.
     */
    enum struct e_log_level : std::int16_t {
        debug,    ///< Debug-level messages.
        info,     ///< Informational messages.
        warning,  ///< Warning conditions.
        error,    ///< Error conditions.
        critical, ///< Critical conditions.
        none = -1 ///< Logging disabled.
    };

    /**
     * @brief Represents a single log message with metadata.
     */
    struct log_message_t {
        /** @brief Severity level of the log message. */
        e_log_level m_level{};

        /** @brief Log message text. */
        std::string m_message{};

        /** @brief Timestamp when the message was created. */
        std::chrono::system_clock::time_point m_timestamp{};
    };

    /**
     * @brief Thread-safe FIFO buffer for storing log messages.
     */
    class log_buffer_t {
      public:
        /**
         * @brief Construct a log buffer with a given capacity.
         * @param capacity Maximum number of messages to buffer.
         */
        NSREDIS_INLINE log_buffer_t(std::size_t capacity = 4096u) : m_capacity(capacity) {}

      public:
        /**
         * @brief Add a log message to the buffer.
         * @param msg Log message to add. Left untouched when the buffer is full.
         * @return True if added successfully, false if buffer is full.
         */
        NSREDIS_INLINE bool push(log_message_t&& msg) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            if (m_buffer.size() >= m_capacity)
                return false;

            m_buffer.push_back(std::move(msg));

            return true;
        }

        /**
         * @brief Remove the oldest log message from the buffer.
         * @param msg Reference to store the removed message.
         * @return True if a message was removed, false if buffer was empty.
         */
        NSREDIS_INLINE bool pop(log_message_t& msg) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            if (m_buffer.empty())
                return false;

            msg = std::move(m_buffer.front());

            m_buffer.pop_front();

            return true;
        }

        /**
         * @brief Get the current number of buffered messages.
         */
        NSREDIS_INLINE std::size_t size() const {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            return m_buffer.size();
        }

        /**
         * @brief Check if the buffer is empty.
         */
        NSREDIS_INLINE bool empty() const {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            return m_buffer.empty();
        }

        /**
         * @brief Retrieve and remove a batch of messages from the front of the buffer.
         * @param batch_size Maximum number of messages to retrieve.
         * @return Vector of log messages, oldest first.
         */
        NSREDIS_INLINE std::vector<log_message_t> get_batch(std::size_t batch_size) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            const auto count = std::min(batch_size, m_buffer.size());

            std::vector<log_message_t> batch{};

            batch.reserve(count);

            for (std::size_t i{}; i < count; i++) {
                batch.push_back(std::move(m_buffer.front()));

                m_buffer.pop_front();
            }

            return batch;
        }

        /**
         * @brief Maximum number of messages the buffer accepts.
         */
        [[nodiscard]] NSREDIS_INLINE std::size_t capacity() const { return m_capacity; }

      private:
        /** @brief Container for buffered log messages. */
        std::deque<log_message_t> m_buffer{};

        /** @brief Mutex for synchronizing access to the buffer. */
        mutable std::shared_mutex m_mutex;

        /** @brief Maximum capacity of the buffer. */
        std::size_t m_capacity;
    };

    /**
     * @brief Asynchronous logger with configurable buffering and overflow handling.
     *
     * Messages below the configured level are dropped before formatting. When the
     * asynchronous worker is running, formatted messages are queued and printed in
     * batches from a background thread; otherwise they are printed immediately.
     */
    class c_logging {
      public:
        /**
         * @brief Overflow handling strategies for the log buffer.
         */
        enum struct e_overflow_strategy {
            block,          ///< Block producer threads until space is available.
            discard_oldest, ///< Discard the oldest message to make room.
            discard_newest  ///< Discard the new incoming message.
        };

        /**
         * @brief Logger configuration.
         */
        struct cfg_t {
            /** @brief Minimum severity level to log. (default: info) */
            e_log_level m_level{e_log_level::info};

            /** @brief Force flush after each log entry. (default: false) */
            bool m_force_flush{false};

            /** @brief Enable asynchronous logging. (default: true) */
            bool m_async{true};

            /** @brief Size of the internal logging buffer. (default: 16384) */
            std::size_t m_buffer_size{16384u};

            /** @brief Strategy to handle buffer overflows. (default: discard_oldest) */
            e_overflow_strategy m_strategy{e_overflow_strategy::discard_oldest};
        };

      public:
        /**
         * @brief Construct a logger with optional log level and flush behavior.
         * @param log_level Minimum severity level to log.
         * @param force_flush Whether to flush output immediately.
         */
        NSREDIS_INLINE c_logging(const e_log_level& log_level = e_log_level::none, bool force_flush = false)
            : m_force_flush(force_flush), m_log_level(log_level), m_running(false) {
        }

        /**
         * @brief Destructor. Stops asynchronous logging and flushes remaining messages.
         */
        NSREDIS_INLINE ~c_logging() { stop_async(); }

        c_logging(const c_logging&) = delete;

        c_logging& operator=(const c_logging&) = delete;

      public:
        /**
         * @brief Initialize the logger with configuration options.
         * @param log_level Minimum severity level to log.
         * @param force_flush Whether to flush output immediately.
         * @param async Enable asynchronous logging.
         * @param buffer_size Size of the internal log buffer.
         * @param strategy Overflow handling strategy.
         */
        NSREDIS_INLINE void init(
            const e_log_level& log_level,

            bool force_flush = false,
            bool async = true,

            std::size_t buffer_size = 16384u,

            e_overflow_strategy strategy = e_overflow_strategy::discard_oldest
        ) {
            m_log_level = log_level;
            m_force_flush = force_flush;
            m_buffer_size = buffer_size;
            m_overflow_strategy = strategy;

            if (!async)
                return;

            start_async();
        }

        /**
         * @brief Initialize the logger from a configuration block.
         * @param cfg Logger configuration.
         */
        NSREDIS_INLINE void init(const cfg_t& cfg) {
            init(cfg.m_level, cfg.m_force_flush, cfg.m_async, cfg.m_buffer_size, cfg.m_strategy);
        }

        /**
         * @brief Convert a log level enum to a string representation.
         */
        NSREDIS_INLINE const char* lvl_to_str(const e_log_level& level) const {
            switch (level) {
                case e_log_level::info:
                    return "INFO";
                case e_log_level::debug:
                    return "DEBUG";
                case e_log_level::warning:
                    return "WARNING";
                case e_log_level::error:
                    return "ERROR";
                case e_log_level::critical:
                    return "CRITICAL";
                default:
                    return "UNKNOWN";
            }
        }

        /**
         * @brief Parse a log level name, case-insensitively.
         * @param str Level name ("debug", "info", "warning", "error", "critical", "none").
         * @return Parsed level, e_log_level::none for unknown names.
         */
        NSREDIS_INLINE static e_log_level lvl_from_str(std::string_view str) {
            if (boost::algorithm::iequals(str, "debug"))
                return e_log_level::debug;

            if (boost::algorithm::iequals(str, "info"))
                return e_log_level::info;

            if (boost::algorithm::iequals(str, "warning")
                || boost::algorithm::iequals(str, "warn"))
                return e_log_level::warning;

            if (boost::algorithm::iequals(str, "error"))
                return e_log_level::error;

            if (boost::algorithm::iequals(str, "critical"))
                return e_log_level::critical;

            return e_log_level::none;
        }

        /**
         * @brief Immediately print a formatted log message, bypassing level and buffering.
         * @tparam _args_t Variadic format argument types.
         * @param log_level Severity level of the message.
         * @param message Format string.
         * @param args Format arguments.
         */
        template <typename... _args_t>
        NSREDIS_INLINE void force_log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            write(log_level, std::chrono::system_clock::now(), fmt::format(message, std::forward<_args_t>(args)...));

            std::fflush(stdout);
        }

        /**
         * @brief Log a formatted message, asynchronously if enabled.
         * @tparam _args_t Variadic format argument types.
         * @param log_level Severity level of the message.
         * @param message Format string.
         * @param args Format arguments.
         */
        template <typename... _args_t>
        NSREDIS_INLINE void log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            if (!enabled(log_level))
                return;

            auto now = std::chrono::system_clock::now();

            auto formatted_message = fmt::format(message, std::forward<_args_t>(args)...);

            if (m_running && m_log_buffer) {
                log_message_t log_msg{log_level, std::move(formatted_message), now};

                if (!m_log_buffer->push(std::move(log_msg))) {
                    handle_overflow(std::move(log_msg));
                }
                else
                    m_condition.notify_one();

                return;
            }

            write(log_level, now, formatted_message);

            if (m_force_flush)
                std::fflush(stdout);
        }

        /**
         * @brief Whether a message of the given level would be logged.
         */
        [[nodiscard]] NSREDIS_INLINE bool enabled(const e_log_level& log_level) const {
            return m_log_level != e_log_level::none
                && log_level != e_log_level::none
                && log_level >= m_log_level;
        }

        /**
         * @brief Start the asynchronous logging thread.
         */
        NSREDIS_INLINE void start_async() {
            if (m_running)
                return;

            m_log_buffer = std::make_unique<log_buffer_t>(m_buffer_size);

            m_running = true;

            m_worker_thread = std::thread(&c_logging::process_logs, this);
        }

        /**
         * @brief Stop the asynchronous logging thread and flush remaining messages.
         */
        NSREDIS_INLINE void stop_async() {
            if (!m_running)
                return;

            {
                std::lock_guard<std::mutex> lock(m_mutex);

                m_running = false;
            }

            m_condition.notify_all();

            if (m_worker_thread.joinable())
                m_worker_thread.join();

            if (m_log_buffer) {
                flush(m_log_buffer->get_batch(m_buffer_size));

                m_log_buffer.reset();
            }
        }

      public:
        /**
         * @brief Current minimum severity level.
         */
        [[nodiscard]] NSREDIS_INLINE e_log_level level() const { return m_log_level; }

        /**
         * @brief Whether the asynchronous worker is running.
         */
        [[nodiscard]] NSREDIS_INLINE bool running() const { return m_running; }

      private:
        /**
         * @brief Print a single log line.
         */
        NSREDIS_INLINE void write(
            const e_log_level& log_level,

            const std::chrono::system_clock::time_point& timestamp,

            const std::string& message
        ) const {
            auto in_time_t = std::chrono::system_clock::to_time_t(timestamp);

            fmt::print(
                "[{:%Y-%m-%d %H:%M:%S}] {} - {}\n",

                fmt::styled(
                    std::chrono::system_clock::time_point(std::chrono::system_clock::from_time_t(in_time_t)),
                    fmt::emphasis::bold | fg(fmt::rgb(245, 245, 184))
                ),

                fmt::styled(
                    lvl_to_str(log_level),
                    fmt::emphasis::bold
                ),

                fmt::styled(
                    message,
                    fg(fmt::rgb(255, 255, 230))
                )
            );
        }

        /**
         * @brief Print a batch of queued messages and flush stdout.
         */
        NSREDIS_INLINE void flush(const std::vector<log_message_t>& batch) const {
            if (batch.empty())
                return;

            for (const auto& msg : batch)
                write(msg.m_level, msg.m_timestamp, msg.m_message);

            std::fflush(stdout);
        }

        /**
         * @brief Handle buffer overflow according to the configured strategy.
         * @param msg Log message that could not be added.
         */
        NSREDIS_INLINE void handle_overflow(log_message_t&& msg) {
            switch (m_overflow_strategy) {
                case e_overflow_strategy::block:
                    {
                        std::unique_lock<std::mutex> lock(m_mutex);

                        m_condition.wait(lock, [this] {
                            return !m_running || (m_log_buffer && m_log_buffer->size() < m_buffer_size);
                        });

                        if (m_running && m_log_buffer) {
                            m_log_buffer->push(std::move(msg));

                            m_condition.notify_one();
                        }

                        break;
                    }

                case e_overflow_strategy::discard_oldest:
                    {
                        if (m_log_buffer) {
                            log_message_t old_msg{};

                            if (m_log_buffer->pop(old_msg)) {
                                m_log_buffer->push(std::move(msg));

                                m_condition.notify_one();
                            }
                        }

                        break;
                    }

                case e_overflow_strategy::discard_newest:
                    break;
            }
        }

        /**
         * @brief Worker thread function for processing log messages asynchronously.
         */
        NSREDIS_INLINE void process_logs() {
            constexpr std::size_t k_batch_size = 256u;

            while (true) {
                {
                    std::unique_lock<std::mutex> lock(m_mutex);

                    m_condition.wait_for(lock, std::chrono::milliseconds(50), [this] {
                        return !m_running || (m_log_buffer && !m_log_buffer->empty());
                    });

                    if (!m_running
                        && (!m_log_buffer
                            || m_log_buffer->empty()))
                        break;
                }

                if (!m_log_buffer)
                    continue;

                flush(m_log_buffer->get_batch(k_batch_size));

                m_condition.notify_all();
            }
        }

      private:
        /** @brief Whether to flush output immediately after each message. */
        bool m_force_flush{};

        /** @brief Minimum severity level to log. */
        e_log_level m_log_level{e_log_level::none};

        /** @brief Indicates if the asynchronous logger is running. */
        std::atomic<bool> m_running{};

        /** @brief Pointer to the internal log message buffer. */
        std::unique_ptr<log_buffer_t> m_log_buffer;

        /** @brief Mutex for synchronizing access to logger state. */
        std::mutex m_mutex;

        /** @brief Condition variable for coordinating producer and consumer threads. */
        std::condition_variable m_condition;

        /** @brief Worker thread for asynchronous logging. */
        std::thread m_worker_thread;

        /** @brief Maximum size of the log buffer. */
        std::size_t m_buffer_size{16384u};

        /** @brief Strategy for handling buffer overflows. */
        e_overflow_strategy m_overflow_strategy{e_overflow_strategy::discard_oldest};
    };
}

#endif // NSREDIS_SHARED_LOGGING_HXX
