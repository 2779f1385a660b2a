#include <nsredis.hxx>

namespace nsredis::redis {
    namespace {
        /** @brief Delete the key only if it still holds the caller's token. */
        constexpr std::string_view k_release_script =
            "if redis.call('get', KEYS[1]) == ARGV[1] then "
            "return redis.call('del', KEYS[1]) "
            "else return 0 end";
    }

    c_redis_lock::c_redis_lock(
        std::shared_ptr<connection_t> connection,

        std::string key,

        lock_cfg_t cfg
    ) : m_connection(std::move(connection)),
        m_key(std::move(key)),
        m_cfg(std::move(cfg)) {
        if (!m_connection)
            throw exceptions::lock_exception_t(fmt::format("Lock '{}' needs a connection", m_key));
    }

    boost::asio::awaitable<bool> c_redis_lock::acquire() {
        if (held())
            throw exceptions::lock_exception_t(fmt::format("Lock '{}' is already held by this instance", m_key));

        auto& logger = m_connection->logger();

        const auto token = boost::uuids::to_string(boost::uuids::random_generator()());

        const auto started = std::chrono::steady_clock::now();

        auto executor = co_await boost::asio::this_coro::executor;

        boost::asio::steady_timer sleep(executor);

        while (true) {
            auto result = co_await m_connection->set_nx(m_key, token, m_cfg.m_timeout);

            if (!result) {
                throw exceptions::lock_exception_t(
                    fmt::format("Failed to acquire '{}': {}", m_key, result.error().message()),

                    result.error().value()
                );
            }

            if (result.value()) {
                m_token = token;

                logger.log(shared::e_log_level::debug, "[Lock:{}] Acquired", m_key);

                co_return true;
            }

            if (!m_cfg.m_blocking)
                co_return false;

            auto wait = m_cfg.m_sleep;

            if (m_cfg.m_blocking_timeout.has_value()) {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

                if (elapsed >= m_cfg.m_blocking_timeout.value()) {
                    logger.log(shared::e_log_level::debug, "[Lock:{}] Timed out after {} ms", m_key, elapsed.count());

                    co_return false;
                }

                wait = std::min(wait, m_cfg.m_blocking_timeout.value() - elapsed);
            }

            sleep.expires_after(wait);

            co_await sleep.async_wait(boost::asio::use_awaitable);
        }
    }

    boost::asio::awaitable<void> c_redis_lock::release() {
        if (!held())
            throw exceptions::lock_exception_t(fmt::format("Cannot release '{}': not held", m_key));

        const auto token = std::exchange(m_token, std::string{});

        auto result = co_await m_connection->eval_int(k_release_script, {m_key}, {token});

        if (!result) {
            throw exceptions::lock_exception_t(
                fmt::format("Failed to release '{}': {}", m_key, result.error().message()),

                result.error().value()
            );
        }

        if (result.value() == 0)
            throw exceptions::lock_exception_t(fmt::format("Cannot release '{}': no longer owned", m_key));

        m_connection->logger().log(shared::e_log_level::debug, "[Lock:{}] Released", m_key);
    }

    boost::asio::awaitable<bool> c_redis_lock::locked() {
        auto result = co_await m_connection->exists(m_key);

        if (!result)
            throw exceptions::lock_exception_t(fmt::format("Failed to inspect '{}': {}", m_key, result.error().message()), result.error().value());

        co_return result.value();
    }

    boost::asio::awaitable<bool> c_redis_lock::owned() {
        if (!held())
            co_return false;

        auto result = co_await m_connection->get(m_key);

        if (!result)
            throw exceptions::lock_exception_t(fmt::format("Failed to inspect '{}': {}", m_key, result.error().message()), result.error().value());

        co_return result.value() == m_token;
    }
}
