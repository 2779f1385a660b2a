/**
 * @file redis.hxx
 * @brief Redis connection wrapper and connection pool.
 */

#ifndef NSREDIS_REDIS_HXX
#define NSREDIS_REDIS_HXX

namespace nsredis::redis {
    /**
     * @brief Result of a single store command.
     * @tparam _type_t Value type on success.
     */
    template <typename _type_t>
    using result_t = boost::system::result<_type_t>;

    /**
     * @brief Decoded server push (RESP3 out-of-band message).
     */
    struct push_message_t {
        /** @brief Push kind: "message", "subscribe", "unsubscribe", "pmessage", ... */
        std::string m_kind{};

        /** @brief Channel the push refers to. */
        std::string m_channel{};

        /** @brief Payload for "message" pushes, subscription count for control pushes. */
        std::string m_payload{};
    };

    /**
     * @brief Represents a single Redis connection.
     */
    struct connection_t {
        /** @brief Shared pointer to a Boost.Redis connection. */
        using boost_connection_t = std::shared_ptr<boost::redis::connection>;

        /**
         * @brief Possible states of a Redis connection.
         */
        enum struct e_status : std::int16_t {
            unknown = -1,       ///< Connection state is unknown.
            relax,              ///< Not yet connected.
            connected,          ///< Successfully connected.
            disconnected,       ///< Gracefully disconnected.
            abort,              ///< Aborted due to error.
            connection_refused, ///< Connection was refused.
            closed              ///< Closed for good, never re-established.
        };

        /**
         * @brief Configuration for an individual connection.
         */
        struct cfg_t {
            /** @brief Host for this connection (default: "127.0.0.1"). */
            std::string m_host{"127.0.0.1"};

            /** @brief Port for this connection (default: "6379"). */
            std::string m_port{"6379"};

            /** @brief Username for this connection. */
            std::string m_user{};

            /** @brief Password for this connection. */
            std::string m_password{};

            /** @brief Database index selected after connecting. */
            std::int32_t m_db{};

            /** @brief Unique identifier for the connection. */
            std::string m_uuid{};

            /** @brief Client name reported to the server. */
            std::string m_client_name{};

            /** @brief Logging level for the underlying Boost.Redis connection. */
            boost::redis::logger::level m_log_level{boost::redis::logger::level::err};
        };

      public:
        /**
         * @brief Construct a Redis connection wrapper.
         * @param cfg Connection configuration.
         * @param connection Underlying Boost.Redis connection.
         * @param logger Logger shared with the owning pool.
         */
        connection_t(
            cfg_t&& cfg,

            boost_connection_t connection,

            std::shared_ptr<shared::c_logging> logger
        );

        /**
         * @brief Destructor shuts down the connection.
         */
        NSREDIS_INLINE ~connection_t() { shutdown(); }

        connection_t() = delete;

        connection_t(const connection_t&) = delete;

        connection_t& operator=(const connection_t&) = delete;

      public:
        /**
         * @brief Establish the connection to Redis asynchronously.
         *
         * A connection that was shut down or aborted gets a fresh Boost.Redis connection
         * on the same executor before it is run again.
         *
         * @return Awaitable resolving to true if connected, false otherwise.
         */
        boost::asio::awaitable<bool> establish();

        /**
         * @brief Shut down this connection immediately.
         *
         * The next command re-establishes it.
         */
        void shutdown();

        /**
         * @brief Shut down this connection for good.
         *
         * Used by the pool on close(); later commands fail instead of reconnecting.
         */
        void close();

        /**
         * @brief Check if the connection is alive (optionally update status).
         * @param update If true, sends a PING to update the status.
         * @return Awaitable resolving to true if connected, false otherwise.
         */
        boost::asio::awaitable<bool> alive(bool update = false);

      public:
        /**
         * @brief Execute a Redis command asynchronously.
         * @tparam _tuple_t Types of response tuple elements.
         * @param request Redis request to send.
         * @param response Response container to populate.
         * @return Awaitable resolving to the error code of the operation.
         */
        template <typename... _tuple_t>
        NSREDIS_NOINLINE boost::asio::awaitable<boost::system::error_code> async_exec(
            boost::redis::request&& request,

            boost::redis::response<_tuple_t...>& response
        ) {
            if (!(co_await revive()))
                co_return boost::system::error_code{boost::asio::error::operation_aborted};

            boost::system::error_code ec{};

            co_await m_connection->async_exec(
                std::move(request), response,

                boost::asio::redirect_error(boost::asio::use_awaitable, ec)
            );

            if (!ec)
                ec = check_reply(response);

            co_return ec;
        }

        /**
         * @brief Execute a Redis command whose replies are not needed (SUBSCRIBE, UNSUBSCRIBE).
         */
        boost::asio::awaitable<boost::system::error_code> async_exec(boost::redis::request&& request);

      public:
        /**
         * @brief Set a string value for a key with optional expiration.
         * @param key Redis key.
         * @param value String value to set.
         * @param expire Optional expiration time in seconds.
         * @return True when the server replied OK.
         */
        boost::asio::awaitable<result_t<bool>> set(
            std::string_view key,
            std::string_view value,

            std::optional<std::int32_t> expire = std::nullopt
        );

        /**
         * @brief Set a key only if it does not exist (SET NX), with optional expiration in milliseconds.
         * @return True if the key was set, false if it already existed.
         */
        boost::asio::awaitable<result_t<bool>> set_nx(
            std::string_view key,
            std::string_view value,

            std::optional<std::chrono::milliseconds> expire = std::nullopt
        );

        /**
         * @brief Get the value of a key.
         * @return The value, or std::nullopt if the key does not exist.
         */
        boost::asio::awaitable<result_t<std::optional<std::string>>> get(std::string_view key);

        /**
         * @brief Delete a key.
         * @return True if the key was deleted, false if it did not exist.
         */
        boost::asio::awaitable<result_t<bool>> del(std::string_view key);

        /**
         * @brief Check if a key exists.
         */
        boost::asio::awaitable<result_t<bool>> exists(std::string_view key);

        /**
         * @brief Get the time-to-live of a key in seconds.
         * @return TTL, -1 if the key has no expiration, -2 if it does not exist.
         */
        boost::asio::awaitable<result_t<std::int64_t>> ttl(std::string_view key);

        /**
         * @brief Find all keys matching a glob-style pattern.
         */
        boost::asio::awaitable<result_t<std::vector<std::string>>> keys(std::string_view pattern);

        /**
         * @brief Add members to a set.
         * @return Number of members that were not already present.
         */
        boost::asio::awaitable<result_t<std::int64_t>> sadd(
            std::string_view key,

            const std::vector<std::string>& values
        );

        /**
         * @brief Number of members of a set.
         */
        boost::asio::awaitable<result_t<std::int64_t>> scard(std::string_view key);

        /**
         * @brief Publish a message to a channel.
         * @return Number of subscribers that received the message.
         */
        boost::asio::awaitable<result_t<std::int64_t>> publish(
            std::string_view channel,
            std::string_view message
        );

        /**
         * @brief Evaluate a Lua script returning an integer.
         */
        boost::asio::awaitable<result_t<std::int64_t>> eval_int(
            std::string_view script,

            const std::vector<std::string>& keys,
            const std::vector<std::string>& args
        );

      public:
        /**
         * @brief Subscribe this connection to a channel.
         *
         * The server confirms with a "subscribe" push delivered through receive_push().
         */
        boost::asio::awaitable<boost::system::error_code> subscribe(std::string_view channel);

        /**
         * @brief Unsubscribe this connection from a channel.
         */
        boost::asio::awaitable<boost::system::error_code> unsubscribe(std::string_view channel);

        /**
         * @brief Wait for the next server push.
         * @param slot Cancellation slot interrupting the wait.
         * @return Awaitable resolving to the error code of the wait.
         */
        boost::asio::awaitable<boost::system::error_code> receive_push(boost::asio::cancellation_slot slot = {});

        /**
         * @brief Pop the oldest complete push out of the push buffer.
         * @return The decoded push, std::nullopt if the buffer holds no complete push.
         */
        std::optional<push_message_t> next_push();

        /**
         * @brief Whether the push buffer holds at least one unconsumed node.
         */
        [[nodiscard]] bool has_pushes() const;

        /**
         * @brief Drop every buffered push.
         */
        void clear_pushes();

        /**
         * @brief Decode the first push stored in a flat RESP3 node sequence.
         * @param nodes Nodes as collected by a generic response.
         * @return Decoded push, std::nullopt if the nodes do not start with a push of at least two elements.
         */
        static std::optional<push_message_t> parse_push(const std::vector<boost::redis::resp3::node>& nodes);

      public:
        /**
         * @brief Access the connection configuration mutable.
         */
        NSREDIS_INLINE auto& cfg() { return m_cfg; }

        /**
         * @brief Access the connection configuration read-only.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& cfg() const { return m_cfg; }

        /**
         * @brief Access the underlying Boost.Redis connection.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& connection() const { return m_connection; }

        /**
         * @brief Current connection status.
         */
        [[nodiscard]] NSREDIS_INLINE e_status status() const { return m_status->load(); }

        /**
         * @brief Override the connection status.
         */
        NSREDIS_INLINE void status(e_status status) { m_status->store(status); }

        /**
         * @brief Access the logger for this connection.
         */
        [[nodiscard]] NSREDIS_INLINE auto& logger() const { return *m_logger; }

      private:
        /**
         * @brief Re-establish a dropped connection before a command.
         * @return Awaitable resolving to true if the connection is usable.
         */
        boost::asio::awaitable<bool> revive();

        /**
         * @brief Extract a server error reply from the first response element.
         */
        template <typename... _tuple_t>
        NSREDIS_INLINE boost::system::error_code check_reply(const boost::redis::response<_tuple_t...>& response) {
            const auto& first = std::get<0u>(response);

            if (!first.has_error())
                return {};

            m_logger->log(
                shared::e_log_level::debug,

                "[{}] Server replied with error: {}",

                m_cfg.m_client_name, first.error().diagnostic
            );

            return boost::redis::error::resp3_simple_error;
        }

      private:
        /** @brief Connection configuration. */
        cfg_t m_cfg{};

        /** @brief Underlying Boost.Redis connection. */
        boost_connection_t m_connection{};

        /** @brief Executor new Boost.Redis connections are created on. */
        boost::asio::any_io_executor m_executor{};

        /** @brief Connection status, shared with the async_run completion handler. */
        std::shared_ptr<std::atomic<e_status>> m_status{};

        /** @brief Buffer the server pushes are collected into. */
        boost::redis::generic_response m_push_response{};

        /** @brief Logger for this connection. */
        std::shared_ptr<shared::c_logging> m_logger{};
    };

    /**
     * @brief Pool of Redis connections for reuse.
     *
     * Connections are created lazily up to the configured maximum. When every
     * connection is in use, acquisition waits until one is released or the
     * acquisition timeout elapses.
     */
    class c_connection_pool {
      public:
        /**
         * @brief Shared pointer to a connection.
         */
        using connection_ptr_t = std::shared_ptr<connection_t>;

        /**
         * @brief Pool configuration parameters.
         */
        struct pool_cfg_t {
            /** @brief Redis server host. (default: 127.0.0.1) */
            std::string m_host{"127.0.0.1"};

            /** @brief Redis server port. (default: 6379) */
            std::string m_port{"6379"};

            /** @brief Database index. (default: 0) */
            std::int32_t m_db{};

            /** @brief Username for Redis authentication. */
            std::string m_user{};

            /** @brief Password for Redis authentication. */
            std::string m_password{};

            /** @brief Maximum connections allowed. (default: 10) */
            std::size_t m_max_connections{10u};

            /** @brief Number of connections created by init(). (default: 0) */
            std::size_t m_initial_connections{0u};

            /** @brief How long acquisition waits for a free connection. (default: 20 seconds) */
            std::chrono::milliseconds m_acquire_timeout{std::chrono::seconds(20)};

            /** @brief Re-establish dead connections on acquisition. (default: true) */
            bool m_health_check_enabled{true};

            /** @brief Logging level for the underlying Boost.Redis connections. */
            boost::redis::logger::level m_log_level{boost::redis::logger::level::err};

          public:
            /**
             * @brief Build a pool configuration from a Redis URL.
             * @param url URL of the form redis://[user[:password]@]host[:port][/db].
             * @return Configuration with the URL fields filled in and defaults elsewhere.
             * @throws exceptions::config_exception_t On a malformed URL.
             */
            static pool_cfg_t from_url(std::string_view url);

            /**
             * @brief Compare the connection parameters (host, port, db, credentials, pool size).
             */
            [[nodiscard]] bool same_target(const pool_cfg_t& other) const;
        };

        /**
         * @brief Wrapper for a single pooled connection.
         */
        struct connection_handle_t {
            /**
             * @brief Construct a connection handle.
             * @param connection Shared connection object.
             * @param id Unique handle identifier.
             */
            NSREDIS_INLINE connection_handle_t(connection_ptr_t connection, std::string id)
                : m_in_use(false),
                  m_connection(std::move(connection)),
                  m_id(std::move(id)) {
            }

          public:
            /**
             * @brief Mark this handle as in use.
             */
            NSREDIS_INLINE void acquire() {
                m_in_use = true;
            }

            /**
             * @brief Release this handle back to the pool.
             */
            NSREDIS_INLINE void release() {
                m_in_use = false;
            }

          public:
            /** @brief Whether this handle is currently in use. */
            bool m_in_use{false};

            /** @brief Shared connection object. */
            connection_ptr_t m_connection{};

            /** @brief Handle identifier. */
            std::string m_id{};
        };

        /**
         * @brief Shared pointer to a connection handle.
         */
        using connection_handle_ptr_t = std::shared_ptr<connection_handle_t>;

        /**
         * @brief RAII wrapper for automatically releasing a connection.
         */
        struct scoped_connection_t {
            /**
             * @brief Take ownership of an acquired handle.
             * @param pool Reference to the connection pool.
             * @param handle Handle to manage.
             */
            NSREDIS_INLINE scoped_connection_t(c_connection_pool& pool, connection_handle_ptr_t handle)
                : m_pool(&pool), m_handle(std::move(handle)) {
            }

            /**
             * @brief Destructor releases the connection back to the pool.
             */
            NSREDIS_INLINE ~scoped_connection_t() { release(); }

            NSREDIS_INLINE scoped_connection_t(scoped_connection_t&& other) noexcept
                : m_pool(other.m_pool), m_handle(std::move(other.m_handle)) {
                other.m_handle = nullptr;
            }

            NSREDIS_INLINE scoped_connection_t& operator=(scoped_connection_t&& other) noexcept {
                if (this != &other) {
                    release();

                    m_pool = other.m_pool;
                    m_handle = std::move(other.m_handle);

                    other.m_handle = nullptr;
                }

                return *this;
            }

            scoped_connection_t(const scoped_connection_t&) = delete;

            scoped_connection_t& operator=(const scoped_connection_t&) = delete;

          public:
            /**
             * @brief Give the connection back to the pool now.
             */
            NSREDIS_INLINE void release() {
                if (!m_handle)
                    return;

                m_pool->release_connection(std::exchange(m_handle, nullptr));
            }

            /**
             * @brief Shared ownership of the underlying connection.
             */
            [[nodiscard]] NSREDIS_INLINE connection_ptr_t connection_ptr() const {
                return m_handle ? m_handle->m_connection : nullptr;
            }

            /**
             * @brief Identifier of the pooled handle.
             */
            [[nodiscard]] NSREDIS_INLINE const std::string& id() const { return m_handle->m_id; }

            NSREDIS_INLINE connection_t* operator->() const { return m_handle->m_connection.get(); }

            NSREDIS_INLINE connection_t& operator*() const { return *m_handle->m_connection; }

            NSREDIS_INLINE explicit operator bool() const { return m_handle && m_handle->m_connection; }

          private:
            /** @brief Pool the handle goes back to. */
            c_connection_pool* m_pool{};

            /** @brief Handle to manage. */
            connection_handle_ptr_t m_handle{};
        };

      public:
        /**
         * @brief Construct a connection pool. No connection is opened here.
         * @param cfg Pool configuration parameters.
         * @param io_ctx Boost.Asio I/O context the connections run on.
         * @param logger Logger shared with the connections and clients.
         */
        c_connection_pool(
            pool_cfg_t&& cfg,

            boost::asio::io_context& io_ctx,

            std::shared_ptr<shared::c_logging> logger
        );

        /**
         * @brief Destructor closes every pooled connection.
         */
        NSREDIS_INLINE ~c_connection_pool() { close(); }

        c_connection_pool(const c_connection_pool&) = delete;

        c_connection_pool& operator=(const c_connection_pool&) = delete;

      public:
        /**
         * @brief Open the configured number of initial connections.
         * @return Awaitable resolving to true if every initial connection was established.
         */
        boost::asio::awaitable<bool> init();

        /**
         * @brief Disconnect every pooled connection. Calls after the first one are no-ops.
         * @return True if this call closed the pool, false if it was already closed.
         */
        bool close();

        /**
         * @brief Create a new connection and wrap it in a handle.
         * @return Awaitable with a handle, or nullptr on failure.
         */
        boost::asio::awaitable<connection_handle_ptr_t> create_connection();

        /**
         * @brief Acquire a connection from the pool, waiting if every connection is in use.
         * @return Awaitable with a scoped connection, std::nullopt if the pool is closed,
         *         the store is unreachable or the acquisition timed out.
         */
        boost::asio::awaitable<std::optional<scoped_connection_t>> acquire_connection();

        /**
         * @brief Release a previously acquired connection back to the pool.
         * @param handle Handle to release.
         */
        void release_connection(connection_handle_ptr_t handle);

      public:
        /**
         * @brief Access the pool configuration read-only.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& cfg() const { return m_cfg; }

        /**
         * @brief Whether close() has been called.
         */
        [[nodiscard]] NSREDIS_INLINE bool closed() const { return m_closed.load(std::memory_order_acquire); }

        /**
         * @brief Number of pooled connections.
         */
        [[nodiscard]] std::size_t size() const;

        /**
         * @brief Number of pooled connections currently handed out.
         */
        [[nodiscard]] std::size_t in_use() const;

        /**
         * @brief Access the shared logger.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& logger() const { return m_logger; }

        /**
         * @brief I/O context the connections run on.
         */
        [[nodiscard]] NSREDIS_INLINE auto& io_ctx() const { return m_io_ctx; }

      private:
        /**
         * @brief Take a free handle and mark it used. Caller holds m_pool_mutex.
         */
        connection_handle_ptr_t take_free_handle();

      private:
        /** @brief The pool configuration. */
        pool_cfg_t m_cfg{};

        /** @brief The pool of connections. */
        std::vector<connection_handle_ptr_t> m_pool{};

        /** @brief Connections being created, counted against the maximum. */
        std::size_t m_pending{};

        /** @brief The mutex for the pool. */
        mutable std::mutex m_pool_mutex;

        /** @brief Set once close() ran. */
        std::atomic<bool> m_closed{false};

        /** @brief The logger for the pool. */
        std::shared_ptr<shared::c_logging> m_logger{};

        /** @brief The io context. */
        boost::asio::io_context& m_io_ctx;
    };
}

#endif // NSREDIS_REDIS_HXX
