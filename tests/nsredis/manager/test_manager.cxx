#include <gtest/gtest.h>

#include <nsredis.hxx>

using namespace nsredis;

namespace {
    manager::manager_cfg_t make_cfg(std::string port = "6379") {
        manager::manager_cfg_t cfg{};

        {
            cfg.m_pool.m_port = std::move(port);
            cfg.m_pool.m_max_connections = 4;

            cfg.m_logger.m_level = shared::e_log_level::error;
            cfg.m_logger.m_async = false;
        }

        return cfg;
    }
}

TEST(ManagerTest, ConstructionPerformsNoIo) {
    boost::asio::io_context io_ctx;

    manager::c_connection_manager manager(io_ctx, make_cfg("6378"));

    EXPECT_NE(manager.get_pool(), nullptr);
    EXPECT_EQ(manager.get_pool()->size(), 0u);
    EXPECT_FALSE(manager.closed());

    EXPECT_EQ(manager.get_pool()->cfg().m_max_connections, 4u);
    EXPECT_EQ(manager.logger().level(), shared::e_log_level::error);
}

TEST(ManagerTest, GetPoolReturnsSameHandle) {
    boost::asio::io_context io_ctx;

    manager::c_connection_manager manager(io_ctx, make_cfg());

    EXPECT_EQ(manager.get_pool(), manager.get_pool());
}

TEST(ManagerTest, CloseIsIdempotent) {
    boost::asio::io_context io_ctx;

    manager::c_connection_manager manager(io_ctx, make_cfg());

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            {
                auto connection = co_await manager.get_pool()->acquire_connection();

                EXPECT_TRUE(connection.has_value());
            }

            EXPECT_EQ(manager.get_pool()->size(), 1u);

            co_await manager.close();

            EXPECT_TRUE(manager.closed());

            co_await manager.close();

            EXPECT_TRUE(manager.closed());

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}

TEST(ManagerTest, AcquireAfterCloseFails) {
    boost::asio::io_context io_ctx;

    manager::c_connection_manager manager(io_ctx, make_cfg());

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            co_await manager.close();

            auto connection = co_await manager.get_pool()->acquire_connection();

            EXPECT_FALSE(connection.has_value());

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}

TEST(ManagerTest, CloseWithoutConnections) {
    boost::asio::io_context io_ctx;

    manager::c_connection_manager manager(io_ctx, make_cfg("6378"));

    auto fut = boost::asio::co_spawn(
        io_ctx,

        [&]() -> boost::asio::awaitable<void> {
            co_await manager.close();

            EXPECT_TRUE(manager.closed());

            co_return;
        },

        boost::asio::use_future
    );

    io_ctx.run();

    EXPECT_NO_THROW(fut.get());

    io_ctx.stop();
}
