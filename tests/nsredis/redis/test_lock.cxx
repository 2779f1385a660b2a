#include <gtest/gtest.h>

#include <nsredis.hxx>

using namespace nsredis;
using namespace nsredis::redis;

namespace {
    std::shared_ptr<c_connection_pool> make_pool(boost::asio::io_context& io_ctx) {
        auto logger = std::make_shared<shared::c_logging>();

        logger->init(shared::e_log_level::error, true, false);

        return std::make_shared<c_connection_pool>(c_connection_pool::pool_cfg_t{}, io_ctx, std::move(logger));
    }
}

TEST(LockTest, KeyFormat) {
    EXPECT_EQ(c_redis_lock::key_for("users"), "users:lock");
    EXPECT_EQ(c_redis_lock::key_for("a:b"), "a:b:lock");
    EXPECT_EQ(c_redis_lock::key_for(""), ":lock");
}

TEST(LockTest, NeedsConnection) {
    EXPECT_THROW(c_redis_lock(nullptr, "test:lock"), exceptions::lock_exception_t);
}

TEST(LockTest, AcquireAndRelease) {
    boost::asio::io_context io_ctx;

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            auto pool = make_pool(io_ctx);

            {
                auto connection = co_await pool->acquire_connection();

                EXPECT_TRUE(connection.has_value());

                co_await (*connection)->del("nsredis:test:lock:basic:lock");

                c_redis_lock lock(connection->connection_ptr(), c_redis_lock::key_for("nsredis:test:lock:basic"));

                EXPECT_FALSE(lock.held());
                EXPECT_FALSE(co_await lock.locked());

                EXPECT_TRUE(co_await lock.acquire());

                EXPECT_TRUE(lock.held());
                EXPECT_FALSE(lock.token().empty());

                EXPECT_TRUE(co_await lock.locked());
                EXPECT_TRUE(co_await lock.owned());

                co_await lock.release();

                EXPECT_FALSE(lock.held());
                EXPECT_FALSE(co_await lock.locked());
            }

            pool->close();

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}

TEST(LockTest, TokenChangesPerAcquisition) {
    boost::asio::io_context io_ctx;

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            auto pool = make_pool(io_ctx);

            {
                auto connection = co_await pool->acquire_connection();

                EXPECT_TRUE(connection.has_value());

                c_redis_lock lock(connection->connection_ptr(), "nsredis:test:lock:token:lock");

                EXPECT_TRUE(co_await lock.acquire());

                const auto first = lock.token();

                co_await lock.release();

                EXPECT_TRUE(co_await lock.acquire());

                EXPECT_NE(lock.token(), first);

                co_await lock.release();
            }

            pool->close();

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}

TEST(LockTest, NonBlockingContention) {
    boost::asio::io_context io_ctx;

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            auto pool = make_pool(io_ctx);

            {
                auto first = co_await pool->acquire_connection();
                auto second = co_await pool->acquire_connection();

                EXPECT_TRUE(first.has_value());
                EXPECT_TRUE(second.has_value());

                const std::string key = "nsredis:test:lock:contention:lock";

                lock_cfg_t cfg{};

                {
                    cfg.m_blocking = false;
                }

                c_redis_lock owner(first->connection_ptr(), key, cfg);
                c_redis_lock other(second->connection_ptr(), key, cfg);

                EXPECT_TRUE(co_await owner.acquire());
                EXPECT_FALSE(co_await other.acquire());

                EXPECT_FALSE(other.held());
                EXPECT_FALSE(co_await other.owned());

                co_await owner.release();

                EXPECT_TRUE(co_await other.acquire());

                co_await other.release();
            }

            pool->close();

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}

TEST(LockTest, BlockingTimeout) {
    boost::asio::io_context io_ctx;

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            auto pool = make_pool(io_ctx);

            {
                auto first = co_await pool->acquire_connection();
                auto second = co_await pool->acquire_connection();

                const std::string key = "nsredis:test:lock:timeout:lock";

                c_redis_lock owner(first->connection_ptr(), key);

                lock_cfg_t cfg{};

                {
                    cfg.m_sleep = std::chrono::milliseconds(20);
                    cfg.m_blocking_timeout = std::chrono::milliseconds(150);
                }

                c_redis_lock waiter(second->connection_ptr(), key, cfg);

                EXPECT_TRUE(co_await owner.acquire());

                const auto started = std::chrono::steady_clock::now();

                EXPECT_FALSE(co_await waiter.acquire());

                EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(150));

                co_await owner.release();
            }

            pool->close();

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}

TEST(LockTest, BlockingWaitsForRelease) {
    boost::asio::io_context io_ctx;

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            auto pool = make_pool(io_ctx);

            {
                auto first = co_await pool->acquire_connection();
                auto second = co_await pool->acquire_connection();

                const std::string key = "nsredis:test:lock:wait:lock";

                c_redis_lock owner(first->connection_ptr(), key);

                lock_cfg_t cfg{};

                {
                    cfg.m_sleep = std::chrono::milliseconds(20);
                }

                c_redis_lock waiter(second->connection_ptr(), key, cfg);

                EXPECT_TRUE(co_await owner.acquire());

                boost::asio::co_spawn(
                    co_await boost::asio::this_coro::executor,

                    [&owner]() -> boost::asio::awaitable<void> {
                        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

                        timer.expires_after(std::chrono::milliseconds(100));

                        co_await timer.async_wait(boost::asio::use_awaitable);

                        co_await owner.release();
                    },

                    boost::asio::detached
                );

                EXPECT_TRUE(co_await waiter.acquire());

                EXPECT_FALSE(owner.held());

                co_await waiter.release();
            }

            pool->close();

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}

TEST(LockTest, ReleaseNotHeldThrows) {
    boost::asio::io_context io_ctx;

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            auto pool = make_pool(io_ctx);

            {
                auto connection = co_await pool->acquire_connection();

                c_redis_lock lock(connection->connection_ptr(), "nsredis:test:lock:unheld:lock");

                EXPECT_THROW(co_await lock.release(), exceptions::lock_exception_t);
            }

            pool->close();

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}

TEST(LockTest, ReleaseAfterExpiryThrows) {
    boost::asio::io_context io_ctx;

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            auto pool = make_pool(io_ctx);

            {
                auto connection = co_await pool->acquire_connection();

                lock_cfg_t cfg{};

                {
                    cfg.m_timeout = std::chrono::milliseconds(50);
                }

                c_redis_lock lock(connection->connection_ptr(), "nsredis:test:lock:expiry:lock", cfg);

                EXPECT_TRUE(co_await lock.acquire());

                boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

                timer.expires_after(std::chrono::milliseconds(150));

                co_await timer.async_wait(boost::asio::use_awaitable);

                EXPECT_FALSE(co_await lock.locked());

                EXPECT_THROW(co_await lock.release(), exceptions::lock_exception_t);
            }

            pool->close();

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}

TEST(LockTest, AcquireTwiceThrows) {
    boost::asio::io_context io_ctx;

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            auto pool = make_pool(io_ctx);

            {
                auto connection = co_await pool->acquire_connection();

                c_redis_lock lock(connection->connection_ptr(), "nsredis:test:lock:twice:lock");

                EXPECT_TRUE(co_await lock.acquire());

                EXPECT_THROW(co_await lock.acquire(), exceptions::lock_exception_t);

                co_await lock.release();
            }

            pool->close();

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}
