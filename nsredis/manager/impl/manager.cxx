#include <nsredis.hxx>

namespace nsredis::manager {
    c_connection_manager::c_connection_manager(boost::asio::io_context& io_ctx, manager_cfg_t cfg)
        : m_cfg(std::move(cfg)),
          m_logger(std::make_shared<shared::c_logging>()) {
        m_logger->init(m_cfg.m_logger);

        auto pool_cfg = m_cfg.m_pool;

        m_pool = std::make_shared<redis::c_connection_pool>(std::move(pool_cfg), io_ctx, m_logger);

        m_logger->log(
            shared::e_log_level::info,

            "[Manager] Pool ready for {}:{}/{} (max connections: {})",

            m_cfg.m_pool.m_host, m_cfg.m_pool.m_port, m_cfg.m_pool.m_db, m_pool->cfg().m_max_connections
        );
    }

    c_connection_manager::~c_connection_manager() {
        m_pool->close();
    }

    std::shared_ptr<c_connection_manager> c_connection_manager::instance(boost::asio::io_context& io_ctx, manager_cfg_t cfg) {
        static std::mutex s_mutex{};

        static std::shared_ptr<c_connection_manager> s_instance{};

        std::lock_guard<std::mutex> lock(s_mutex);

        if (!s_instance) {
            s_instance = std::make_shared<c_connection_manager>(io_ctx, std::move(cfg));

            return s_instance;
        }

        if (!s_instance->m_cfg.m_pool.same_target(cfg.m_pool)) {
            s_instance->m_logger->log(
                shared::e_log_level::warning,

                "[Manager] Ignoring configuration {}:{}/{}, reusing the existing pool for {}:{}/{}",

                cfg.m_pool.m_host, cfg.m_pool.m_port, cfg.m_pool.m_db,

                s_instance->m_cfg.m_pool.m_host, s_instance->m_cfg.m_pool.m_port, s_instance->m_cfg.m_pool.m_db
            );
        }

        return s_instance;
    }

    boost::asio::awaitable<void> c_connection_manager::close() {
        try {
            if (m_pool->close())
                m_logger->log(shared::e_log_level::info, "[Manager] Closed Redis connection pool");
        }
        catch (const std::exception& e) {
            m_logger->log(shared::e_log_level::error, "[Manager] Error closing Redis connection pool: {}", e.what());
        }

        co_return;
    }
}
