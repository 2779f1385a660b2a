/**
 * @file manager.hxx
 * @brief Owner of the shared connection pool.
 */

#ifndef NSREDIS_MANAGER_HXX
#define NSREDIS_MANAGER_HXX

namespace nsredis::manager {
    /**
     * @brief Configuration of a connection manager.
     */
    struct manager_cfg_t {
        /** @brief Pool settings (host, port, db, max connections, ...). */
        redis::c_connection_pool::pool_cfg_t m_pool{};

        /** @brief Logger settings, shared by the pool, its connections and clients. */
        shared::c_logging::cfg_t m_logger{};
    };

    /**
     * @brief Owns one connection pool and the logger every component bound to it uses.
     *
     * The preferred use is explicit: construct one manager in the process entry point
     * and hand it (or its pool) to every client. instance() is the process-wide
     * accessor: the arguments of its first call win and every later call returns
     * the same manager, whatever arguments it passes.
     */
    class c_connection_manager {
      public:
        /**
         * @brief Construct a manager. Creates the pool without opening any connection.
         * @param io_ctx I/O context the pooled connections run on.
         * @param cfg Manager configuration.
         */
        c_connection_manager(boost::asio::io_context& io_ctx, manager_cfg_t cfg = {});

        /**
         * @brief Destructor closes the pool.
         */
        ~c_connection_manager();

        c_connection_manager(const c_connection_manager&) = delete;

        c_connection_manager& operator=(const c_connection_manager&) = delete;

      public:
        /**
         * @brief Process-wide manager, created by the first call.
         * @param io_ctx I/O context; only honoured on the first call.
         * @param cfg Configuration; only honoured on the first call.
         * @return The one process-wide manager.
         */
        static std::shared_ptr<c_connection_manager> instance(boost::asio::io_context& io_ctx, manager_cfg_t cfg = {});

      public:
        /**
         * @brief Shared pool handle. No I/O.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& get_pool() const { return m_pool; }

        /**
         * @brief Disconnect every pooled connection. Calls after the first one do nothing.
         *
         * Failures are logged, never thrown.
         */
        boost::asio::awaitable<void> close();

        /**
         * @brief Whether close() has run.
         */
        [[nodiscard]] NSREDIS_INLINE bool closed() const { return m_pool->closed(); }

        /**
         * @brief Configuration the manager was built with.
         */
        [[nodiscard]] NSREDIS_INLINE const auto& cfg() const { return m_cfg; }

        /**
         * @brief Shared logger.
         */
        [[nodiscard]] NSREDIS_INLINE auto& logger() const { return *m_logger; }

      private:
        /** @brief Configuration. */
        manager_cfg_t m_cfg{};

        /** @brief Logger shared with the pool. */
        std::shared_ptr<shared::c_logging> m_logger{};

        /** @brief The pool. */
        std::shared_ptr<redis::c_connection_pool> m_pool{};
    };
}

#endif // NSREDIS_MANAGER_HXX
