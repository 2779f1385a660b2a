/**
 * @file lock.hxx
 * @brief Store-backed mutual-exclusion lock.
 */

#ifndef NSREDIS_REDIS_LOCK_HXX
#define NSREDIS_REDIS_LOCK_HXX

namespace nsredis::redis {
    /**
     * @brief Lock acquisition and expiry settings.
     */
    struct lock_cfg_t {
        /** @brief Expiry of the lock key. Without one the key lives until released. */
        std::optional<std::chrono::milliseconds> m_timeout{};

        /** @brief Delay between acquisition attempts. (default: 100 ms) */
        std::chrono::milliseconds m_sleep{100};

        /** @brief Retry until acquired instead of failing on the first attempt. (default: true) */
        bool m_blocking{true};

        /** @brief Upper bound on a blocking acquisition. Without one it waits forever. */
        std::optional<std::chrono::milliseconds> m_blocking_timeout{};
    };

    /**
     * @brief Mutual-exclusion lock stored under a single Redis key.
     *
     * Acquisition is `SET key token NX [PX timeout]` with a random token per
     * acquisition; release deletes the key only when it still holds our token.
     * Every process that talks to the same store and uses the same key is
     * serialized, not only the tasks of this process.
     */
    class c_redis_lock {
      public:
        /**
         * @brief Construct a lock. No I/O happens here.
         * @param connection Connection the lock commands are sent on.
         * @param key Lock key.
         * @param cfg Acquisition settings.
         */
        c_redis_lock(
            std::shared_ptr<connection_t> connection,

            std::string key,

            lock_cfg_t cfg = {}
        );

      public:
        /**
         * @brief Acquire the lock.
         * @return True if acquired, false if non-blocking and already held, or the blocking timeout elapsed.
         * @throws exceptions::lock_exception_t If already held by this instance or the store fails.
         */
        boost::asio::awaitable<bool> acquire();

        /**
         * @brief Release the lock.
         * @throws exceptions::lock_exception_t If the lock is not held or is now owned by someone else.
         */
        boost::asio::awaitable<void> release();

        /**
         * @brief Whether the lock key currently exists in the store, held by anyone.
         */
        boost::asio::awaitable<bool> locked();

        /**
         * @brief Whether the lock key currently holds this instance's token.
         */
        boost::asio::awaitable<bool> owned();

      public:
        /**
         * @brief Lock key used for a namespace.
         * @param name_space Namespace string.
         * @return "<namespace>:lock"
         */
        NSREDIS_INLINE static std::string key_for(std::string_view name_space) { return fmt::format("{}:lock", name_space); }

        /**
         * @brief Lock key.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& key() const { return m_key; }

        /**
         * @brief Token of the current acquisition, empty when not held.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& token() const { return m_token; }

        /**
         * @brief Whether this instance believes it holds the lock.
         */
        [[nodiscard]] NSREDIS_INLINE bool held() const { return !m_token.empty(); }

        /**
         * @brief Acquisition settings.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& cfg() const { return m_cfg; }

      private:
        /** @brief Connection the lock commands are sent on. */
        std::shared_ptr<connection_t> m_connection{};

        /** @brief Lock key. */
        std::string m_key{};

        /** @brief Token of the current acquisition. */
        std::string m_token{};

        /** @brief Acquisition settings. */
        lock_cfg_t m_cfg{};
    };
}

#endif // NSREDIS_REDIS_LOCK_HXX
