// include once
#include <boost/redis/src.hpp>
// ...

#include <nsredis.hxx>

namespace nsredis::redis {
    namespace {
        template <typename _type_t>
        NSREDIS_INLINE result_t<_type_t> make_error(const boost::system::error_code& ec) {
            return result_t<_type_t>(boost::system::in_place_error, ec);
        }
    }

    connection_t::connection_t(
        cfg_t&& cfg,

        boost_connection_t connection,

        std::shared_ptr<shared::c_logging> logger
    ) : m_cfg(std::move(cfg)),
        m_connection(std::move(connection)),
        m_executor(m_connection->get_executor()),
        m_status(std::make_shared<std::atomic<e_status>>(e_status::relax)),
        m_logger(logger ? std::move(logger) : std::make_shared<shared::c_logging>()) {
        m_connection->set_receive_response(m_push_response);
    }

    boost::asio::awaitable<bool> connection_t::establish() {
        switch (status()) {
            case e_status::connected:
                co_return true;

            case e_status::closed:
                co_return false;

            case e_status::disconnected:
            case e_status::abort:
            case e_status::connection_refused:
                {
                    m_connection = std::make_shared<boost::redis::connection>(m_executor);

                    m_push_response = {};

                    m_connection->set_receive_response(m_push_response);

                    status(e_status::relax);

                    break;
                }

            default:
                break;
        }

        boost::redis::config redis_cfg{};

        if (m_cfg.m_client_name.empty()) {
            m_cfg.m_client_name = "Connection-Unknown";
        }
        else if (!m_cfg.m_uuid.empty()
                 && !boost::algorithm::ends_with(m_cfg.m_client_name, m_cfg.m_uuid)) {
            m_cfg.m_client_name = fmt::format("{}-{}", m_cfg.m_client_name, m_cfg.m_uuid);
        }

        {
            redis_cfg.addr = boost::redis::address(
                m_cfg.m_host, m_cfg.m_port
            );

            if (!m_cfg.m_user.empty())
                redis_cfg.username = m_cfg.m_user;

            if (!m_cfg.m_password.empty())
                redis_cfg.password = m_cfg.m_password;

            redis_cfg.database_index = m_cfg.m_db;

            {
                redis_cfg.clientname = m_cfg.m_client_name;

                redis_cfg.health_check_id = fmt::format("{}-HealthCheck", m_cfg.m_client_name);

                redis_cfg.log_prefix = fmt::format("[{}] ", m_cfg.m_client_name);
            }

            {
                redis_cfg.health_check_interval = std::chrono::seconds(0u);
                redis_cfg.reconnect_wait_interval = std::chrono::seconds(0u);
            }
        }

        m_connection->async_run(
            redis_cfg, {m_cfg.m_log_level},

            boost::asio::consign(
                [status = m_status](const boost::system::error_code& error_code) {
                    if (!error_code)
                        return;

                    const auto& message = error_code.message();

                    if (boost::algorithm::icontains(message, "connection refused")) {
                        status->store(e_status::connection_refused);
                    }
                    else if (!boost::algorithm::icontains(message, "operation cancel"))
                        status->store(e_status::abort);
                },

                m_connection
            )
        );

        {
            auto executor = co_await boost::asio::this_coro::executor;

            boost::asio::steady_timer sleep(executor);

            sleep.expires_after(std::chrono::milliseconds(100u));

            co_await sleep.async_wait(boost::asio::use_awaitable);

            if (status() == e_status::abort
                || status() == e_status::connection_refused) {
                m_logger->log(
                    shared::e_log_level::debug,

                    "[{}] Failed to connect to {}:{}",

                    m_cfg.m_client_name, m_cfg.m_host, m_cfg.m_port
                );

                co_return false;
            }
        }

        co_return co_await alive(true);
    }

    void connection_t::shutdown() {
        const auto current = status();

        if (current == e_status::closed)
            return;

        if (m_connection
            && current != e_status::abort
            && current != e_status::connection_refused
            && current != e_status::disconnected)
            m_connection->cancel();

        status(e_status::disconnected);
    }

    void connection_t::close() {
        if (status() == e_status::closed)
            return;

        shutdown();

        status(e_status::closed);
    }

    boost::asio::awaitable<bool> connection_t::revive() {
        switch (status()) {
            case e_status::connected:
                co_return true;

            case e_status::disconnected:
            case e_status::abort:
            case e_status::connection_refused:
                {
                    m_logger->log(shared::e_log_level::debug, "[{}] Reconnecting to {}:{}", m_cfg.m_client_name, m_cfg.m_host, m_cfg.m_port);

                    co_return co_await establish();
                }

            default:
                co_return false;
        }
    }

    boost::asio::awaitable<bool> connection_t::alive(bool update) {
        if (update) {
            boost::redis::request::config config{
                .cancel_on_connection_lost = false,
                .cancel_if_not_connected = false,
                .cancel_if_unresponded = false
            };

            boost::redis::request request(std::move(config));

            request.push("PING", "PONG");

            boost::redis::response<std::string> response{};

            boost::system::error_code ec{};

            co_await m_connection->async_exec(
                std::move(request), response,

                boost::asio::redirect_error(boost::asio::use_awaitable, ec)
            );

            if (ec
                || std::get<0u>(response).has_error()) {
                status(e_status::abort);

                co_return false;
            }

            status(
                std::get<0u>(response).value() == "PONG"
                    ? e_status::connected
                    : e_status::abort
            );
        }

        co_return status() == e_status::connected;
    }

    boost::asio::awaitable<boost::system::error_code> connection_t::async_exec(boost::redis::request&& request) {
        if (!(co_await revive()))
            co_return boost::system::error_code{boost::asio::error::operation_aborted};

        boost::system::error_code ec{};

        co_await m_connection->async_exec(
            std::move(request), boost::redis::ignore,

            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );

        co_return ec;
    }

    boost::asio::awaitable<result_t<bool>> connection_t::set(
        std::string_view key,
        std::string_view value,

        std::optional<std::int32_t> expire
    ) {
        boost::redis::request request{};

        if (expire.has_value()) {
            request.push("SET", key, value, "EX", std::to_string(expire.value()));
        }
        else
            request.push("SET", key, value);

        boost::redis::response<std::string> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] set() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<bool>(ec);
        }

        co_return std::get<0u>(response).value() == "OK";
    }

    boost::asio::awaitable<result_t<bool>> connection_t::set_nx(
        std::string_view key,
        std::string_view value,

        std::optional<std::chrono::milliseconds> expire
    ) {
        boost::redis::request request{};

        if (expire.has_value()) {
            request.push("SET", key, value, "NX", "PX", std::to_string(expire->count()));
        }
        else
            request.push("SET", key, value, "NX");

        boost::redis::response<std::optional<std::string>> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] set_nx() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<bool>(ec);
        }

        const auto& reply = std::get<0u>(response).value();

        co_return reply.has_value() && reply.value() == "OK";
    }

    boost::asio::awaitable<result_t<std::optional<std::string>>> connection_t::get(std::string_view key) {
        boost::redis::request request{};

        request.push("GET", key);

        boost::redis::response<std::optional<std::string>> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] get() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<std::optional<std::string>>(ec);
        }

        co_return std::get<0u>(response).value();
    }

    boost::asio::awaitable<result_t<bool>> connection_t::del(std::string_view key) {
        boost::redis::request request{};

        request.push("DEL", key);

        boost::redis::response<std::int64_t> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] del() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<bool>(ec);
        }

        co_return std::get<0u>(response).value() > 0;
    }

    boost::asio::awaitable<result_t<bool>> connection_t::exists(std::string_view key) {
        boost::redis::request request{};

        request.push("EXISTS", key);

        boost::redis::response<std::int64_t> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] exists() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<bool>(ec);
        }

        co_return std::get<0u>(response).value() > 0;
    }

    boost::asio::awaitable<result_t<std::int64_t>> connection_t::ttl(std::string_view key) {
        boost::redis::request request{};

        request.push("TTL", key);

        boost::redis::response<std::int64_t> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] ttl() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<std::int64_t>(ec);
        }

        co_return std::get<0u>(response).value();
    }

    boost::asio::awaitable<result_t<std::vector<std::string>>> connection_t::keys(std::string_view pattern) {
        boost::redis::request request{};

        request.push("KEYS", pattern);

        boost::redis::response<std::vector<std::string>> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] keys() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<std::vector<std::string>>(ec);
        }

        co_return std::move(std::get<0u>(response).value());
    }

    boost::asio::awaitable<result_t<std::int64_t>> connection_t::sadd(
        std::string_view key,

        const std::vector<std::string>& values
    ) {
        boost::redis::request request{};

        request.push_range("SADD", key, values);

        boost::redis::response<std::int64_t> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] sadd() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<std::int64_t>(ec);
        }

        co_return std::get<0u>(response).value();
    }

    boost::asio::awaitable<result_t<std::int64_t>> connection_t::scard(std::string_view key) {
        boost::redis::request request{};

        request.push("SCARD", key);

        boost::redis::response<std::int64_t> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] scard() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<std::int64_t>(ec);
        }

        co_return std::get<0u>(response).value();
    }

    boost::asio::awaitable<result_t<std::int64_t>> connection_t::publish(
        std::string_view channel,
        std::string_view message
    ) {
        boost::redis::request request{};

        request.push("PUBLISH", channel, message);

        boost::redis::response<std::int64_t> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] publish() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<std::int64_t>(ec);
        }

        co_return std::get<0u>(response).value();
    }

    boost::asio::awaitable<result_t<std::int64_t>> connection_t::eval_int(
        std::string_view script,

        const std::vector<std::string>& keys,
        const std::vector<std::string>& args
    ) {
        std::vector<std::string> params{};

        params.reserve(2u + keys.size() + args.size());

        params.emplace_back(script);
        params.emplace_back(std::to_string(keys.size()));

        params.insert(params.end(), keys.begin(), keys.end());
        params.insert(params.end(), args.begin(), args.end());

        boost::redis::request request{};

        request.push_range("EVAL", params.begin(), params.end());

        boost::redis::response<std::int64_t> response{};

        if (auto ec = co_await async_exec(std::move(request), response); ec) {
            m_logger->log(shared::e_log_level::debug, "[{}] eval() failed: {}", m_cfg.m_client_name, ec.message());

            co_return make_error<std::int64_t>(ec);
        }

        co_return std::get<0u>(response).value();
    }

    boost::asio::awaitable<boost::system::error_code> connection_t::subscribe(std::string_view channel) {
        boost::redis::request request{};

        request.push("SUBSCRIBE", channel);

        co_return co_await async_exec(std::move(request));
    }

    boost::asio::awaitable<boost::system::error_code> connection_t::unsubscribe(std::string_view channel) {
        boost::redis::request request{};

        request.push("UNSUBSCRIBE", channel);

        co_return co_await async_exec(std::move(request));
    }

    boost::asio::awaitable<boost::system::error_code> connection_t::receive_push(boost::asio::cancellation_slot slot) {
        if (!(co_await alive()))
            co_return boost::system::error_code{boost::asio::error::operation_aborted};

        boost::system::error_code ec{};

        co_await m_connection->async_receive(
            boost::asio::bind_cancellation_slot(
                slot,

                boost::asio::redirect_error(boost::asio::use_awaitable, ec)
            )
        );

        co_return ec;
    }

    bool connection_t::has_pushes() const {
        return !m_push_response.has_error() && !m_push_response.value().empty();
    }

    std::optional<push_message_t> connection_t::next_push() {
        if (m_push_response.has_error()) {
            m_logger->log(
                shared::e_log_level::debug,

                "[{}] Push buffer holds an error: {}",

                m_cfg.m_client_name, m_push_response.error().diagnostic
            );

            clear_pushes();

            return std::nullopt;
        }

        if (m_push_response.value().empty())
            return std::nullopt;

        auto message = parse_push(m_push_response.value());

        boost::system::error_code ec{};

        boost::redis::consume_one(m_push_response, ec);

        if (ec)
            clear_pushes();

        return message;
    }

    void connection_t::clear_pushes() {
        m_push_response = {};
    }

    std::optional<push_message_t> connection_t::parse_push(const std::vector<boost::redis::resp3::node>& nodes) {
        if (nodes.empty())
            return std::nullopt;

        const auto& head = nodes.front();

        if (head.data_type != boost::redis::resp3::type::push
            || head.aggregate_size < 2u
            || nodes.size() < head.aggregate_size + 1u)
            return std::nullopt;

        push_message_t message{};

        message.m_kind = nodes[1u].value;

        if (message.m_kind == "pmessage"
            && head.aggregate_size >= 4u) {
            message.m_channel = nodes[3u].value;
            message.m_payload = nodes[4u].value;

            return message;
        }

        message.m_channel = nodes[2u].value;

        if (head.aggregate_size >= 3u)
            message.m_payload = nodes[3u].value;

        return message;
    }

    c_connection_pool::pool_cfg_t c_connection_pool::pool_cfg_t::from_url(std::string_view url) {
        auto parsed = boost::urls::parse_uri(url);

        if (!parsed)
            throw exceptions::config_exception_t(fmt::format("Invalid URL '{}': {}", url, parsed.error().message()));

        const auto& uri = parsed.value();

        if (!boost::algorithm::iequals(uri.scheme(), "redis"))
            throw exceptions::config_exception_t(fmt::format("Unsupported scheme '{}' in '{}'", std::string_view(uri.scheme()), url));

        pool_cfg_t cfg{};

        if (uri.has_userinfo()) {
            cfg.m_user = uri.user();

            if (uri.has_password())
                cfg.m_password = uri.password();
        }

        if (auto host = uri.host(); !host.empty())
            cfg.m_host = std::move(host);

        if (uri.has_port()) {
            const std::string_view port = uri.port();

            std::uint16_t number{};

            if (auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), number);
                port.empty() || ec != std::errc() || ptr != port.data() + port.size() || number == 0u)
                throw exceptions::config_exception_t(fmt::format("Invalid port '{}' in '{}'", port, url));

            cfg.m_port = std::string(port);
        }

        if (auto path = uri.path(); path.size() > 1u) {
            std::string_view db = path;

            db.remove_prefix(1u);

            std::int32_t index{};

            if (auto [ptr, ec] = std::from_chars(db.data(), db.data() + db.size(), index);
                ec != std::errc() || ptr != db.data() + db.size() || index < 0)
                throw exceptions::config_exception_t(fmt::format("Invalid database index '{}' in '{}'", db, url));

            cfg.m_db = index;
        }

        return cfg;
    }

    bool c_connection_pool::pool_cfg_t::same_target(const pool_cfg_t& other) const {
        return m_host == other.m_host
            && m_port == other.m_port
            && m_db == other.m_db
            && m_user == other.m_user
            && m_password == other.m_password
            && m_max_connections == other.m_max_connections;
    }

    c_connection_pool::c_connection_pool(
        pool_cfg_t&& cfg,

        boost::asio::io_context& io_ctx,

        std::shared_ptr<shared::c_logging> logger
    ) : m_cfg(std::move(cfg)),
        m_logger(logger ? std::move(logger) : std::make_shared<shared::c_logging>()),
        m_io_ctx(io_ctx) {
        if (m_cfg.m_max_connections == 0u) {
            m_logger->log(shared::e_log_level::warning, "[Pool] Maximum connections can't be zero, using 1");

            m_cfg.m_max_connections = 1u;
        }

        m_logger->log(
            shared::e_log_level::debug,

            "[Pool] Created for {}:{}/{} (max connections: {})",

            m_cfg.m_host, m_cfg.m_port, m_cfg.m_db, m_cfg.m_max_connections
        );
    }

    boost::asio::awaitable<bool> c_connection_pool::init() {
        if (closed())
            co_return false;

        const auto count = std::min(m_cfg.m_initial_connections, m_cfg.m_max_connections);

        while (size() < count) {
            auto handle = co_await create_connection();

            if (!handle)
                co_return false;

            std::lock_guard<std::mutex> lock(m_pool_mutex);

            if (closed()) {
                handle->m_connection->close();

                co_return false;
            }

            m_pool.push_back(std::move(handle));
        }

        co_return true;
    }

    bool c_connection_pool::close() {
        if (m_closed.exchange(true, std::memory_order_acq_rel))
            return false;

        std::vector<connection_handle_ptr_t> handles{};

        {
            std::lock_guard<std::mutex> lock(m_pool_mutex);

            handles.swap(m_pool);
        }

        for (auto& handle : handles)
            if (handle->m_connection)
                handle->m_connection->close();

        m_logger->log(shared::e_log_level::info, "[Pool] Closed {} connection(s) to {}:{}", handles.size(), m_cfg.m_host, m_cfg.m_port);

        return true;
    }

    boost::asio::awaitable<c_connection_pool::connection_handle_ptr_t> c_connection_pool::create_connection() {
        try {
            auto uuid = boost::uuids::to_string(boost::uuids::random_generator()());

            auto redis_connection = std::make_shared<boost::redis::connection>(m_io_ctx);

            connection_t::cfg_t cfg{
                .m_host = m_cfg.m_host,
                .m_port = m_cfg.m_port,

                .m_user = m_cfg.m_user,
                .m_password = m_cfg.m_password,

                .m_db = m_cfg.m_db,

                .m_uuid = uuid,

                .m_client_name = "Connection",

                .m_log_level = m_cfg.m_log_level
            };

            auto connection = std::make_shared<connection_t>(
                std::move(cfg),

                std::move(redis_connection),

                m_logger
            );

            if (!(co_await connection->establish())) {
                m_logger->log(
                    shared::e_log_level::error,

                    "[Pool] Failed to connect to {}:{}",

                    m_cfg.m_host, m_cfg.m_port
                );

                co_return nullptr;
            }

            co_return std::make_shared<connection_handle_t>(std::move(connection), std::move(uuid));
        }
        catch (const std::exception& e) {
            m_logger->log(shared::e_log_level::error, "[Pool] Failed to create Redis connection: {}", e.what());
        }

        co_return nullptr;
    }

    boost::asio::awaitable<std::optional<c_connection_pool::scoped_connection_t>> c_connection_pool::acquire_connection() {
        if (closed())
            co_return std::nullopt;

        const auto deadline = std::chrono::steady_clock::now() + m_cfg.m_acquire_timeout;

        connection_handle_ptr_t handle{};

        bool create{};

        for (std::size_t attempt{};; attempt++) {
            {
                std::lock_guard<std::mutex> lock(m_pool_mutex);

                handle = take_free_handle();

                if (!handle
                    && m_pool.size() + m_pending < m_cfg.m_max_connections) {
                    m_pending++;

                    create = true;
                }
            }

            if (handle || create)
                break;

            const auto now = std::chrono::steady_clock::now();

            if (now >= deadline) {
                m_logger->log(
                    shared::e_log_level::warning,

                    "[Pool] Timed out waiting for a free connection ({} in use)",

                    m_cfg.m_max_connections
                );

                co_return std::nullopt;
            }

            auto executor = co_await boost::asio::this_coro::executor;

            boost::asio::steady_timer wait_timer(executor);

            wait_timer.expires_after(
                std::min<std::chrono::steady_clock::duration>(
                    std::chrono::milliseconds(100u * (1u << std::min<std::size_t>(attempt, 3u))),

                    deadline - now
                )
            );

            co_await wait_timer.async_wait(boost::asio::use_awaitable);

            if (closed())
                co_return std::nullopt;
        }

        if (create) {
            handle = co_await create_connection();

            std::lock_guard<std::mutex> lock(m_pool_mutex);

            m_pending--;

            if (!handle)
                co_return std::nullopt;

            if (closed()) {
                handle->m_connection->close();

                co_return std::nullopt;
            }

            handle->acquire();

            m_pool.push_back(handle);
        }
        else if (m_cfg.m_health_check_enabled) {
            if (!(co_await handle->m_connection->alive())) {
                m_logger->log(shared::e_log_level::debug, "[Pool] Re-establishing connection {}", handle->m_id);

                if (!(co_await handle->m_connection->establish())) {
                    release_connection(handle);

                    co_return std::nullopt;
                }
            }
        }

        co_return scoped_connection_t(*this, std::move(handle));
    }

    void c_connection_pool::release_connection(connection_handle_ptr_t handle) {
        std::lock_guard<std::mutex> lock(m_pool_mutex);

        if (!handle)
            return;

        handle->release();
    }

    std::size_t c_connection_pool::size() const {
        std::lock_guard<std::mutex> lock(m_pool_mutex);

        return m_pool.size();
    }

    std::size_t c_connection_pool::in_use() const {
        std::lock_guard<std::mutex> lock(m_pool_mutex);

        return static_cast<std::size_t>(
            std::count_if(m_pool.begin(), m_pool.end(), [](const auto& handle) { return handle->m_in_use; })
        );
    }

    c_connection_pool::connection_handle_ptr_t c_connection_pool::take_free_handle() {
        auto it = std::find_if(m_pool.begin(), m_pool.end(), [](const auto& handle) { return !handle->m_in_use; });

        if (it == m_pool.end())
            return nullptr;

        (*it)->acquire();

        return *it;
    }
}
