/**
 * @file cancellation.hxx
 * @brief Cancellation token for long-running client loops.
 */

#ifndef NSREDIS_CLIENT_CANCELLATION_HXX
#define NSREDIS_CLIENT_CANCELLATION_HXX

namespace nsredis::client {
    /**
     * @brief Copyable handle used to stop a subscription from outside.
     *
     * Copies share one state. cancel() may be called from any thread: the flag is
     * set immediately, and a wait the token is bound to is interrupted on the
     * executor it runs on.
     */
    class c_cancellation_token {
      public:
        /**
         * @brief Construct a fresh, not cancelled token.
         */
        c_cancellation_token();

      public:
        /**
         * @brief Request cancellation. Later calls are no-ops.
         */
        void cancel();

        /**
         * @brief Whether cancellation was requested.
         */
        [[nodiscard]] bool cancelled() const;

        /**
         * @brief Bind the token to the executor of the operation it will interrupt.
         * @param executor Executor the bound wait runs on.
         * @return Slot to attach to the wait. Cancellation delivers boost::asio::cancellation_type::terminal.
         * @note Only one operation can be bound at a time; binding again replaces the previous executor.
         */
        boost::asio::cancellation_slot bind(const boost::asio::any_io_executor& executor);

        /**
         * @brief Detach the token from its executor.
         */
        void unbind();

        /**
         * @brief Whether two tokens share the same state.
         */
        [[nodiscard]] NSREDIS_INLINE bool operator==(const c_cancellation_token& other) const { return m_state == other.m_state; }

      private:
        /**
         * @brief State shared by every copy of a token.
         */
        struct state_t {
            /** @brief Set once cancel() is called. */
            std::atomic<bool> m_cancelled{false};

            /** @brief Signal connected to the bound wait. */
            boost::asio::cancellation_signal m_signal{};

            /** @brief Executor the bound wait runs on. */
            std::optional<boost::asio::any_io_executor> m_executor{};

            /** @brief Guards m_executor. */
            std::mutex m_mutex{};
        };

        /** @brief Shared state. */
        std::shared_ptr<state_t> m_state{};
    };
}

#endif // NSREDIS_CLIENT_CANCELLATION_HXX
