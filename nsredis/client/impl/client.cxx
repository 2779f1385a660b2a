#include <nsredis.hxx>

namespace nsredis::client {
    namespace {
        /** @brief Upper bound for waiting on the unsubscribe confirmation. */
        constexpr std::chrono::milliseconds k_unsubscribe_wait{1000};
    }

    c_namespaced_client::c_namespaced_client(std::string name_space, const manager::c_connection_manager& manager, client_cfg_t cfg)
        : c_namespaced_client(std::move(name_space), manager.get_pool(), std::move(cfg)) {
    }

    c_namespaced_client::c_namespaced_client(std::string name_space, std::shared_ptr<redis::c_connection_pool> pool, client_cfg_t cfg)
        : m_namespace(std::move(name_space)),
          m_cfg(std::move(cfg)),
          m_pool(std::move(pool)) {
        if (!m_pool)
            throw exceptions::connection_exception_t(fmt::format("[{}] No connection pool given", m_namespace));

        m_logger = m_pool->logger();
    }

    c_namespaced_client::~c_namespaced_client() {
        for (auto& token : m_subscriptions)
            token.cancel();

        reset();
    }

    boost::asio::awaitable<c_namespaced_client::client_ptr_t> c_namespaced_client::create(
        std::string name_space,

        const manager::c_connection_manager& manager,

        client_cfg_t cfg
    ) {
        auto client = std::make_shared<c_namespaced_client>(std::move(name_space), manager, std::move(cfg));

        co_await client->init();

        co_return client;
    }

    boost::asio::awaitable<c_namespaced_client::client_ptr_t> c_namespaced_client::create(
        std::string name_space,

        std::shared_ptr<redis::c_connection_pool> pool,

        client_cfg_t cfg
    ) {
        auto client = std::make_shared<c_namespaced_client>(std::move(name_space), std::move(pool), std::move(cfg));

        co_await client->init();

        co_return client;
    }

    boost::asio::awaitable<c_namespaced_client&> c_namespaced_client::init() {
        if (m_state == e_state::ready)
            co_return *this;

        if (m_state == e_state::initializing)
            throw exceptions::connection_exception_t(fmt::format("[{}] init() is already in progress", m_namespace));

        m_state = e_state::initializing;

        auto connection = co_await m_pool->acquire_connection();

        if (!connection.has_value() || !connection.value()) {
            m_state = e_state::uninitialized;

            const auto reason = m_pool->closed() ? "connection pool is closed" : "no connection available";

            m_logger->log(shared::e_log_level::error, "[{}] Error initializing Redis connection: {}", m_namespace, reason);

            throw exceptions::connection_exception_t(fmt::format("[{}] Error initializing Redis connection: {}", m_namespace, reason));
        }

        m_lock.emplace(connection->connection_ptr(), lock_key(), m_cfg.m_lock);
        m_connection.emplace(std::move(connection.value()));

        m_state = e_state::ready;

        m_logger->log(shared::e_log_level::info, "[{}] Initialized Redis connection", m_namespace);

        co_return *this;
    }

    boost::asio::awaitable<void> c_namespaced_client::close() {
        for (auto& token : m_subscriptions)
            token.cancel();

        if (m_state != e_state::ready)
            co_return;

        reset();

        m_state = e_state::closed;

        m_logger->log(shared::e_log_level::info, "[{}] Closed Redis connection", m_namespace);
    }

    boost::asio::awaitable<void> c_namespaced_client::scoped(std::function<boost::asio::awaitable<void>(c_namespaced_client&)> fn) {
        co_await init();

        std::exception_ptr error{};

        try {
            co_await fn(*this);
        }
        catch (...) {
            error = std::current_exception();
        }

        co_await close();

        if (error)
            std::rethrow_exception(error);
    }

    boost::asio::awaitable<bool> c_namespaced_client::set(std::string_view key, std::string_view value, std::optional<std::int32_t> ttl) {
        connection("set");

        co_return co_await with_lock<bool>("set", [&](redis::connection_t& conn) -> boost::asio::awaitable<bool> {
            const auto result = co_await conn.set(key, value, ttl);

            if (!result)
                co_return fail<bool>("set", key, result.error(), false);

            m_logger->log(shared::e_log_level::debug, "[{}] Set key {}", m_namespace, key);

            co_return result.value();
        });
    }

    boost::asio::awaitable<std::optional<std::string>> c_namespaced_client::get(std::string_view key) {
        auto& conn = connection("get");

        auto result = co_await conn.get(key);

        if (!result)
            co_return fail<std::optional<std::string>>("get", key, result.error(), std::nullopt);

        co_return std::move(result.value());
    }

    boost::asio::awaitable<std::vector<std::string>> c_namespaced_client::keys(std::string_view pattern) {
        auto& conn = connection("keys");

        auto result = co_await conn.keys(pattern);

        if (!result)
            co_return fail<std::vector<std::string>>("keys", pattern, result.error(), {});

        co_return std::move(result.value());
    }

    boost::asio::awaitable<std::int64_t> c_namespaced_client::sadd(std::string_view key, std::vector<std::string> values) {
        connection("sadd");

        if (values.empty())
            co_return 0;

        co_return co_await with_lock<std::int64_t>("sadd", [&](redis::connection_t& conn) -> boost::asio::awaitable<std::int64_t> {
            const auto result = co_await conn.sadd(key, values);

            if (!result)
                co_return fail<std::int64_t>("sadd", key, result.error(), 0);

            co_return result.value();
        });
    }

    boost::asio::awaitable<std::int64_t> c_namespaced_client::publish(std::string_view channel, std::string_view message) {
        auto& conn = connection("publish");

        const auto result = co_await conn.publish(channel, message);

        if (!result)
            co_return fail<std::int64_t>("publish", channel, result.error(), -1);

        co_return result.value();
    }

    boost::asio::awaitable<void> c_namespaced_client::subscribe(std::string channel, message_handler_t on_message, c_cancellation_token token) {
        connection("subscribe");

        if (token.cancelled())
            co_return;

        auto subscriber = co_await m_pool->acquire_connection();

        if (!subscriber.has_value() || !subscriber.value()) {
            fail<bool>("subscribe", channel, boost::asio::error::not_connected, false);

            co_return;
        }

        auto conn = subscriber->connection_ptr();

        m_subscriptions.push_back(token);

        auto slot = token.bind(co_await boost::asio::this_coro::executor);

        std::exception_ptr error{};

        bool subscribed{false};

        try {
            if (const auto ec = co_await conn->subscribe(channel); ec)
                fail<bool>("subscribe", channel, ec, false);
            else {
                subscribed = true;

                m_logger->log(shared::e_log_level::info, "[{}] Subscribed to channel {}", m_namespace, channel);

                while (!token.cancelled()) {
                    const auto ec = co_await conn->receive_push(slot);

                    if (ec) {
                        if (!token.cancelled() && ec != boost::asio::error::operation_aborted)
                            fail<bool>("subscribe", channel, ec, false);

                        break;
                    }

                    while (conn->has_pushes() && !token.cancelled()) {
                        auto push = conn->next_push();

                        if (!push.has_value() || push->m_kind != "message" || push->m_channel != channel)
                            continue;

                        m_logger->log(shared::e_log_level::debug, "[{}] Received message from {}", m_namespace, channel);

                        co_await on_message(std::move(push->m_payload));
                    }
                }
            }
        }
        catch (...) {
            error = std::current_exception();
        }

        token.unbind();

        std::erase(m_subscriptions, token);

        bool clean{!subscribed};

        if (subscribed)
            clean = co_await unsubscribe(*conn, channel);

        if (!clean)
            conn->shutdown();

        subscriber->release();

        m_logger->log(shared::e_log_level::info, "[{}] Unsubscribed from channel {}", m_namespace, channel);

        if (error)
            std::rethrow_exception(error);
    }

    redis::connection_t& c_namespaced_client::connection(std::string_view operation) const {
        if (m_state != e_state::ready || !m_connection.has_value() || !m_connection.value()) {
            const auto when = m_state == e_state::closed ? "after close()" : "before init()";

            throw exceptions::not_initialized_exception_t(
                fmt::format("[{}] {}() called {}: Redis connection is not initialized", m_namespace, operation, when)
            );
        }

        return *m_connection.value();
    }

    template <typename _type_t>
    boost::asio::awaitable<_type_t> c_namespaced_client::with_lock(std::string_view operation, locked_fn_t<_type_t> fn) {
        co_await wait_turn();

        std::exception_ptr error{};

        std::optional<_type_t> result{};

        try {
            result.emplace(co_await under_lock<_type_t>(operation, std::move(fn)));
        }
        catch (...) {
            error = std::current_exception();
        }

        pass_turn();

        if (error)
            std::rethrow_exception(error);

        co_return std::move(result.value());
    }

    template <typename _type_t>
    boost::asio::awaitable<_type_t> c_namespaced_client::under_lock(std::string_view operation, locked_fn_t<_type_t> fn) {
        auto& conn = connection(operation);
        auto& lock = m_lock.value();

        if (!(co_await lock.acquire()))
            throw exceptions::lock_exception_t(fmt::format("[{}] Could not acquire {}", m_namespace, lock.key()));

        std::exception_ptr error{};

        std::optional<_type_t> result{};

        try {
            result.emplace(co_await fn(conn));
        }
        catch (...) {
            error = std::current_exception();
        }

        try {
            co_await lock.release();
        }
        catch (const exceptions::lock_exception_t& e) {
            if (!error)
                throw;

            m_logger->log(shared::e_log_level::error, "[{}] {}", m_namespace, e.what());
        }

        if (error)
            std::rethrow_exception(error);

        co_return std::move(result.value());
    }

    template <typename _type_t>
    _type_t c_namespaced_client::fail(std::string_view operation, std::string_view target, const boost::system::error_code& ec, _type_t soft) const {
        m_logger->log(shared::e_log_level::error, "[{}] {}() failed for {}: {}", m_namespace, operation, target, ec.message());

        if (m_cfg.m_error_policy == e_error_policy::propagate)
            throw exceptions::operation_exception_t(
                fmt::format("[{}] {}() failed for {}: {}", m_namespace, operation, target, ec.message()),

                ec.value()
            );

        return soft;
    }

    boost::asio::awaitable<void> c_namespaced_client::wait_turn() {
        if (!m_turn_taken) {
            m_turn_taken = true;

            co_return;
        }

        auto waiter = std::make_shared<boost::asio::steady_timer>(
            co_await boost::asio::this_coro::executor,

            boost::asio::steady_timer::time_point::max()
        );

        m_waiters.push_back(waiter);

        boost::system::error_code ec{};

        co_await waiter->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        // pass_turn() dequeues the waiter before waking it
        if (const auto it = std::find(m_waiters.begin(), m_waiters.end(), waiter); it != m_waiters.end()) {
            m_waiters.erase(it);

            throw boost::system::system_error(ec ? ec : boost::system::error_code{boost::asio::error::operation_aborted});
        }
    }

    void c_namespaced_client::pass_turn() {
        if (m_waiters.empty()) {
            m_turn_taken = false;

            return;
        }

        auto next = std::move(m_waiters.front());

        m_waiters.pop_front();

        next->cancel();
    }

    void c_namespaced_client::reset() {
        m_lock.reset();
        m_connection.reset();
    }

    boost::asio::awaitable<bool> c_namespaced_client::unsubscribe(redis::connection_t& connection, std::string_view channel) {
        connection.clear_pushes();

        if (!(co_await connection.alive()))
            co_return false;

        if (const auto ec = co_await connection.unsubscribe(channel); ec) {
            m_logger->log(shared::e_log_level::error, "[{}] Error unsubscribing from {}: {}", m_namespace, channel, ec.message());

            co_return false;
        }

        auto signal = std::make_shared<boost::asio::cancellation_signal>();

        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

        timer.expires_after(k_unsubscribe_wait);

        timer.async_wait([signal](const boost::system::error_code& ec) {
            if (!ec)
                signal->emit(boost::asio::cancellation_type::terminal);
        });

        bool confirmed{false};

        while (!confirmed) {
            if (const auto ec = co_await connection.receive_push(signal->slot()); ec)
                break;

            while (connection.has_pushes()) {
                const auto push = connection.next_push();

                if (push.has_value() && push->m_kind == "unsubscribe" && push->m_channel == channel)
                    confirmed = true;
            }
        }

        timer.cancel();

        signal->slot().clear();

        connection.clear_pushes();

        co_return confirmed;
    }
}
