/**
 * @file client.hxx
 * @brief Namespaced convenience client over a shared connection pool.
 */

#ifndef NSREDIS_CLIENT_HXX
#define NSREDIS_CLIENT_HXX

#include "cancellation/cancellation.hxx"

namespace nsredis::client {
    /**
     * @brief What a client does when a store command fails.
     */
    enum struct e_error_policy : std::int16_t {
        swallow,  ///< Log and return a soft result (false, std::nullopt, empty, 0, -1).
        propagate ///< Log and throw exceptions::operation_exception_t.
    };

    /**
     * @brief Client configuration.
     */
    struct client_cfg_t {
        /** @brief Error policy for store commands. (default: swallow) */
        e_error_policy m_error_policy{e_error_policy::swallow};

        /** @brief Settings of the namespace lock. */
        redis::lock_cfg_t m_lock{};
    };

    /**
     * @brief Awaitable callback invoked for every message a subscription receives.
     */
    using message_handler_t = std::function<boost::asio::awaitable<void>(std::string)>;

    /**
     * @brief Lightweight handle bound to one namespace and one pool.
     *
     * Construction performs no I/O. init() borrows one connection from the pool and
     * creates the namespace lock, both kept until close(). set() and sadd() hold the
     * lock "<namespace>:lock" for the duration of the command; get(), keys(),
     * publish() and subscribe() take no lock.
     *
     * Store errors are logged and handled according to the error policy. Under the
     * default policy a failed get() is indistinguishable from an absent key.
     */
    class c_namespaced_client {
      public:
        /**
         * @brief Lifecycle states.
         */
        enum struct e_state : std::int16_t {
            uninitialized, ///< Constructed, no connection.
            initializing,  ///< init() in progress.
            ready,         ///< Connection and lock present.
            closed         ///< Connection released by close().
        };

        /** @brief Shared pointer to a client. */
        using client_ptr_t = std::shared_ptr<c_namespaced_client>;

      public:
        /**
         * @brief Construct a client bound to a manager's pool.
         * @param name_space Namespace; names the lock key.
         * @param manager Manager owning the pool.
         * @param cfg Client configuration.
         */
        c_namespaced_client(std::string name_space, const manager::c_connection_manager& manager, client_cfg_t cfg = {});

        /**
         * @brief Construct a client bound to a pool.
         * @param name_space Namespace; names the lock key.
         * @param pool Shared pool.
         * @param cfg Client configuration.
         */
        c_namespaced_client(std::string name_space, std::shared_ptr<redis::c_connection_pool> pool, client_cfg_t cfg = {});

        /**
         * @brief Destructor releases the connection without logging.
         */
        ~c_namespaced_client();

        c_namespaced_client(const c_namespaced_client&) = delete;

        c_namespaced_client& operator=(const c_namespaced_client&) = delete;

      public:
        /**
         * @brief Create and initialize a client.
         * @throws exceptions::connection_exception_t If no connection could be obtained.
         */
        static boost::asio::awaitable<client_ptr_t> create(
            std::string name_space,

            const manager::c_connection_manager& manager,

            client_cfg_t cfg = {}
        );

        /**
         * @brief Create and initialize a client bound to a pool.
         * @throws exceptions::connection_exception_t If no connection could be obtained.
         */
        static boost::asio::awaitable<client_ptr_t> create(
            std::string name_space,

            std::shared_ptr<redis::c_connection_pool> pool,

            client_cfg_t cfg = {}
        );

      public:
        /**
         * @brief Borrow a connection from the pool and create the namespace lock.
         *
         * No-op when already ready. A closed client can be initialized again.
         *
         * @return This client.
         * @throws exceptions::connection_exception_t If the pool is closed, exhausted or the store is unreachable.
         *         The client stays uninitialized.
         */
        boost::asio::awaitable<c_namespaced_client&> init();

        /**
         * @brief Release the connection and drop the lock. Idempotent.
         *
         * Active subscriptions of this client are cancelled. Other clients and the
         * pool itself are not affected.
         */
        boost::asio::awaitable<void> close();

        /**
         * @brief Run a function with an initialized client, closing it afterwards.
         *
         * The client is closed even when the function throws; the exception is rethrown.
         *
         * @param fn Awaitable function receiving this client.
         */
        boost::asio::awaitable<void> scoped(std::function<boost::asio::awaitable<void>(c_namespaced_client&)> fn);

      public:
        /**
         * @brief Set a key under the namespace lock.
         * @param key Key.
         * @param value Value.
         * @param ttl Optional expiration in seconds.
         * @return True when stored, false on a swallowed store error.
         */
        boost::asio::awaitable<bool> set(
            std::string_view key,
            std::string_view value,

            std::optional<std::int32_t> ttl = std::nullopt
        );

        /**
         * @brief Get a key.
         * @return The value, std::nullopt if absent or on a swallowed store error.
         */
        boost::asio::awaitable<std::optional<std::string>> get(std::string_view key);

        /**
         * @brief Keys matching a glob-style pattern, in no particular order.
         * @return Matching keys, empty on a swallowed store error.
         */
        boost::asio::awaitable<std::vector<std::string>> keys(std::string_view pattern);

        /**
         * @brief Add members to a set under the namespace lock.
         * @return Number of newly added members, 0 on a swallowed store error.
         */
        boost::asio::awaitable<std::int64_t> sadd(std::string_view key, std::vector<std::string> values);

        /**
         * @brief Variadic form of sadd().
         */
        template <typename... _values_t>
            requires(sizeof...(_values_t) > 0u && (std::is_convertible_v<_values_t, std::string_view> && ...))
        NSREDIS_INLINE boost::asio::awaitable<std::int64_t> sadd(std::string_view key, _values_t&&... values) {
            return sadd(key, std::vector<std::string>{std::string(std::string_view(values))...});
        }

        /**
         * @brief Publish a message to a channel.
         * @return Number of subscribers that received it, -1 on a swallowed store error.
         */
        boost::asio::awaitable<std::int64_t> publish(std::string_view channel, std::string_view message);

        /**
         * @brief Receive messages of a channel until cancelled, closed or the stream ends.
         *
         * The subscription borrows a dedicated connection from the pool for its whole
         * lifetime and gives it back after unsubscribing. Only "message" pushes reach the handler; subscription confirmations and other
         * control pushes are skipped. The handler is awaited before the next push is
         * read, so at most one runs at a time, in arrival order. A handler exception
         * ends the subscription and is rethrown after unsubscribing.
         *
         * @param channel Channel name.
         * @param on_message Handler receiving each payload.
         * @param token Token stopping the loop from outside.
         * @note The client must outlive the subscriptions it runs.
         */
        boost::asio::awaitable<void> subscribe(
            std::string channel,

            message_handler_t on_message,

            c_cancellation_token token = {}
        );

      public:
        /**
         * @brief Namespace of this client.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& name_space() const { return m_namespace; }

        /**
         * @brief Lock key of this client's namespace.
         */
        [[nodiscard]] NSREDIS_INLINE std::string lock_key() const { return redis::c_redis_lock::key_for(m_namespace); }

        /**
         * @brief Current lifecycle state.
         */
        [[nodiscard]] NSREDIS_INLINE e_state state() const { return m_state; }

        /**
         * @brief Whether the client is ready for operations.
         */
        [[nodiscard]] NSREDIS_INLINE bool ready() const { return m_state == e_state::ready; }

        /**
         * @brief Current error policy.
         */
        [[nodiscard]] NSREDIS_INLINE e_error_policy error_policy() const { return m_cfg.m_error_policy; }

        /**
         * @brief Change the error policy.
         */
        NSREDIS_INLINE void error_policy(e_error_policy policy) { m_cfg.m_error_policy = policy; }

        /**
         * @brief Shared pool handle.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& pool() const { return m_pool; }

        /**
         * @brief Number of subscriptions currently running.
         */
        [[nodiscard]] NSREDIS_INLINE std::size_t subscriptions() const { return m_subscriptions.size(); }

      private:
        /**
         * @brief Connection of a ready client.
         * @throws exceptions::not_initialized_exception_t If the client is not ready.
         */
        redis::connection_t& connection(std::string_view operation) const;

        /**
         * @brief Command run under the namespace lock.
         */
        template <typename _type_t>
        using locked_fn_t = std::function<boost::asio::awaitable<_type_t>(redis::connection_t&)>;

        /**
         * @brief Run a command while holding the namespace lock.
         *
         * Locked commands of this client run one at a time, in call order; later
         * callers wait for their turn before taking the store lock.
         */
        template <typename _type_t>
        boost::asio::awaitable<_type_t> with_lock(std::string_view operation, locked_fn_t<_type_t> fn);

        /**
         * @brief Take the store lock, run the command and release the lock, even when it throws.
         * @throws exceptions::lock_exception_t If the lock could not be acquired.
         */
        template <typename _type_t>
        boost::asio::awaitable<_type_t> under_lock(std::string_view operation, locked_fn_t<_type_t> fn);

        /**
         * @brief Wait until no other locked command of this client runs.
         */
        boost::asio::awaitable<void> wait_turn();

        /**
         * @brief Hand the turn to the next waiting locked command, if any.
         */
        void pass_turn();

        /**
         * @brief Apply the error policy to a failed command.
         * @return The soft result under e_error_policy::swallow.
         * @throws exceptions::operation_exception_t Under e_error_policy::propagate.
         */
        template <typename _type_t>
        _type_t fail(std::string_view operation, std::string_view target, const boost::system::error_code& ec, _type_t soft) const;

        /**
         * @brief Drop the connection and the lock.
         */
        void reset();

        /**
         * @brief Unsubscribe a connection and drain pushes up to the confirmation.
         * @return True if the connection is clean enough to go back to the pool as is.
         */
        boost::asio::awaitable<bool> unsubscribe(redis::connection_t& connection, std::string_view channel);

      private:
        /** @brief Namespace. */
        std::string m_namespace{};

        /** @brief Client configuration. */
        client_cfg_t m_cfg{};

        /** @brief Shared pool. */
        std::shared_ptr<redis::c_connection_pool> m_pool{};

        /** @brief Logger shared with the pool. */
        std::shared_ptr<shared::c_logging> m_logger{};

        /** @brief Borrowed connection, present while ready. */
        std::optional<redis::c_connection_pool::scoped_connection_t> m_connection{};

        /** @brief Namespace lock, present while ready. */
        std::optional<redis::c_redis_lock> m_lock{};

        /** @brief Lifecycle state. */
        e_state m_state{e_state::uninitialized};

        /** @brief Whether a locked command of this client is running. */
        bool m_turn_taken{false};

        /** @brief Locked commands waiting for their turn, oldest first. */
        std::deque<std::shared_ptr<boost::asio::steady_timer>> m_waiters{};

        /** @brief Tokens of the running subscriptions. */
        std::vector<c_cancellation_token> m_subscriptions{};
    };
}

#endif // NSREDIS_CLIENT_HXX
